#include "core/agent/prompt_builder.h"
#include "core/agent/turn_parser.h"

#include <QStringList>

namespace lc {

QString PromptBuilder::systemPrompt()
{
    const QString tool = QString::fromLatin1(TurnParser::kSearchToolName);
    return QStringLiteral(
        "You are a meticulous legal assistant. Find the single paragraph of the legal "
        "documents that justifies why the given answer to the given question is correct.\n"
        "\n"
        "You receive a Question and its Correct Answer. Locate the paragraph stating the "
        "rule or regulation that proves the answer.\n"
        "\n"
        "Procedure:\n"
        "1. Read the Question and the Correct Answer. Write a precise search query that "
        "combines their key terms, in the language of the documents.\n"
        "2. Call the %1 tool with that query.\n"
        "3. Each result shows a paragraph's text and its location (doc_id, chapter_id, "
        "paragraph_id).\n"
        "4. Check whether a result directly supports the Correct Answer.\n"
        "5. If none does, refine the query with more specific or different terms and "
        "search again.\n"
        "6. If repeated searches do not find a justifying paragraph, stop and report "
        "failure.\n"
        "\n"
        "Your Final Answer must be exactly one JSON object and nothing else.\n"
        "On success:\n"
        "{\"doc_id\": 9, \"chapter_id\": 5, \"paragraph_id\": 434408}\n"
        "On failure:\n"
        "{\"error\": \"Justification paragraph not found after multiple attempts.\"}\n"
        "\n"
        "TOOLS:\n"
        "%1: searches the legal documents with combined keyword and semantic search. "
        "Input is a concise search query.\n"
        "\n"
        "To use the tool, reply in this format:\n"
        "Thought: Do I need to use a tool? Yes\n"
        "Action: %1\n"
        "Action Input: the search query\n"
        "\n"
        "The result arrives in the next message as \"Observation: ...\".\n"
        "\n"
        "When you have the answer, reply in this format:\n"
        "Thought: Do I need to use a tool? No\n"
        "Final Answer: the JSON object\n").arg(tool);
}

QString PromptBuilder::taskDescription(const QString& question, const QStringList& correctAnswers)
{
    return QStringLiteral("Question: %1\nCorrect Answer: %2")
        .arg(question, correctAnswers.join(QStringLiteral(", ")));
}

QString PromptBuilder::formatObservation(const std::vector<ParagraphRecord>& records)
{
    if (records.empty()) {
        return noResultsObservation();
    }

    QStringList blocks;
    blocks.reserve(static_cast<int>(records.size()));
    for (const ParagraphRecord& record : records) {
        blocks.push_back(
            QStringLiteral("Source (doc_id: %1, chapter_id: %2, paragraph_id: %3):\nContent: %4\n")
                .arg(record.location.docId)
                .arg(record.location.chapterId)
                .arg(record.location.paragraphId)
                .arg(record.text));
    }
    return blocks.join(QStringLiteral("\n---\n"));
}

QString PromptBuilder::formatParseError(const QString& reason)
{
    return QStringLiteral(
        "Invalid format: %1. Reply either with \"Action: %2\" followed by "
        "\"Action Input: <query>\", or with \"Final Answer: <one JSON object>\".")
        .arg(reason, QString::fromLatin1(TurnParser::kSearchToolName));
}

QString PromptBuilder::noResultsObservation()
{
    return QStringLiteral("No relevant documents found for this query.");
}

} // namespace lc
