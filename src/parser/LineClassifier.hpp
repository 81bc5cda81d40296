// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <parser/PlanTypes.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tfview
{

/// @brief Tunables of the line classifier.
struct ClassifierOptions
{
    /// Suffixes that mark an unterminated tail as an interactive prompt.
    std::vector<std::string> promptSentinels = { "Enter a value:" };
};

/// @brief Incremental parser for human-readable plan/apply output.
///
/// Bytes are fed in arbitrary chunks and assembled into lines. Each line is classified
/// as part of a diagnostic block (between "╷" and "╵"), as a resource header or body
/// (`# <address> will be created` followed by a brace-balanced `resource "..." {` block),
/// or as a plain log line.
///
/// The classifier never fails. Malformed input degrades to log lines or partially
/// filled records, and finish() flushes every piece of buffered state.
class LineClassifier
{
  public:
    explicit LineClassifier(ClassifierOptions options = {});

    /// @brief Consumes a chunk of raw bytes.
    /// @return Messages for every line completed by this chunk, plus a Prompt if the
    ///         unterminated tail now looks like one.
    [[nodiscard]] auto feed(std::string_view bytes) -> std::vector<StreamMessage>;

    /// @brief Ends the stream.
    ///
    /// The unterminated tail is processed as a final line, then any open diagnostic block
    /// and resource are emitted, followed by a StreamFinished message.
    [[nodiscard]] auto finish() -> std::vector<StreamMessage>;

  private:
    enum class State
    {
        Normal,
        InsideDiagnosticBlock,
        InsideResourceBlock,
    };

    void processLine(std::string_view rawLine, std::vector<StreamMessage>& out);
    void processNormalLine(std::string_view rawLine, std::string_view line, std::vector<StreamMessage>& out);
    void openDiagnosticBlock(std::string_view rawLine, std::vector<StreamMessage>& out);
    void checkPrompt(std::vector<StreamMessage>& out);
    void flushDiagnostic(std::vector<StreamMessage>& out);
    void flushResource(std::vector<StreamMessage>& out);

    ClassifierOptions _options;
    State _state = State::Normal;
    std::string _pending;
    std::vector<std::string> _diagnosticLines;
    std::optional<ResourceChange> _resource;
    int _braceDepth = 0;
    std::string _lastPrompt;
    bool _receivedContent = false;
};

/// @brief Parsed `# <address> <action phrase>` header.
struct ResourceHeader
{
    std::string address;
    std::string phrase;
};

/// @brief Matches a resource header line (already ANSI-stripped).
[[nodiscard]] auto parseResourceHeader(std::string_view line) -> std::optional<ResourceHeader>;

/// @brief Removes the "│" block-line prefix and the single space after it.
///
/// Escape sequences before the prefix are kept. Lines without the prefix are returned unchanged.
[[nodiscard]] auto stripBlockPrefix(std::string_view line) -> std::string;

} // namespace tfview
