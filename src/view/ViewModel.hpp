// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <parser/PlanTypes.hpp>
#include <view/Projection.hpp>
#include <view/Summary.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tfview
{

/// @brief Options fixed for the lifetime of a ViewModel.
struct ViewModelOptions
{
    bool interactive = false; ///< A child runs under a pseudo-terminal and accepts keystrokes.
    bool startInLogView = true;
    int mouseScrollLines = 3;
};

/// @brief What the header reports about the input stream.
enum class StreamStatus
{
    Live,
    WaitingForInput,
    Done,
    Failed, ///< The child exited with a non-zero code.
};

/// @brief UI state reducer. Owns every record received from the reader thread.
///
/// Messages are accumulated by apply() and only mark the projection dirty; tick()
/// rebuilds it in batches. Operations that change expand state or the viewport rebuild
/// immediately and then re-clamp cursor and offset so that
/// 0 <= cursor < lines().size() (or 0 when empty) and
/// 0 <= offset <= max(0, lines().size() - visibleHeight()).
///
/// Not thread-safe; used from the UI thread only.
class ViewModel
{
  public:
    /// @brief Screen rows above the first content row (header, blank, scroll indicator).
    static constexpr int ContentTopRow = 3;

    /// @brief Rows used by the header, indicators and footer.
    static constexpr int ChromeRows = 6;

    /// @brief Rows used by a pinned prompt (blank line plus prompt).
    static constexpr int PromptRows = 2;

    explicit ViewModel(ViewModelOptions options = {});

    // ===== stream =====

    void apply(StreamMessage message);

    /// @brief The queue closed without a StreamFinished message.
    void streamClosed();

    /// @brief Records the child's exit code; a non-zero code forces the log view.
    void setExitCode(int exitCode);

    /// @brief Batched rebuild: re-projects if anything changed and follows the tail.
    void tick();

    // ===== navigation =====

    void moveCursor(int delta);
    void pageUp();
    void pageDown();
    void home();
    void end();

    /// @brief Mouse wheel; @p direction < 0 scrolls up.
    void scroll(int direction);

    /// @brief Left click on a screen row: selects the line, or toggles it when already selected.
    void click(int screenRow);

    void toggleExpand(std::size_t lineIndex);
    void toggleExpandAtCursor();
    void setAllExpanded(bool expanded);
    void toggleViewMode();
    void resize(int width, int height);

    // ===== interactive input =====

    /// @brief Enters typing state; has no effect unless interactive.
    auto beginInput() -> bool;
    void appendInput(std::string_view text);
    void eraseLastInputCharacter();
    void cancelInput();

    /// @brief Leaves typing state and returns the bytes to send to the child.
    [[nodiscard]] auto submitInput() -> std::string;

    // ===== queries =====

    [[nodiscard]] auto lines() const noexcept -> std::vector<Line> const& { return _lines; }
    [[nodiscard]] auto cursor() const noexcept -> int { return _cursor; }
    [[nodiscard]] auto offset() const noexcept -> int { return _offset; }
    [[nodiscard]] auto viewMode() const noexcept -> ViewMode { return _mode; }
    [[nodiscard]] auto visibleHeight() const noexcept -> int;
    [[nodiscard]] auto width() const noexcept -> int { return _width; }
    [[nodiscard]] auto following() const noexcept -> bool { return _following; }
    [[nodiscard]] auto typing() const noexcept -> bool { return _typing; }
    [[nodiscard]] auto interactive() const noexcept -> bool { return _options.interactive; }
    [[nodiscard]] auto inputText() const noexcept -> std::string const& { return _input; }
    [[nodiscard]] auto prompt() const noexcept -> std::string const& { return _prompt; }
    [[nodiscard]] auto done() const noexcept -> bool { return _done; }
    [[nodiscard]] auto exitCode() const noexcept -> std::optional<int> { return _exitCode; }
    [[nodiscard]] auto status() const noexcept -> StreamStatus;
    [[nodiscard]] auto summary() const -> PlanSummary;

    [[nodiscard]] auto resources() const noexcept -> std::vector<ResourceChange> const& { return _resources; }
    [[nodiscard]] auto diagnostics() const noexcept -> std::vector<Diagnostic> const& { return _diagnostics; }
    [[nodiscard]] auto logs() const noexcept -> std::vector<LogLine> const& { return _logs; }

  private:
    void rebuild();
    void setViewMode(ViewMode mode);
    void clampCursor();
    void clampOffset();
    void ensureCursorVisible();
    [[nodiscard]] auto hasContent() const noexcept -> bool;

    ViewModelOptions _options;

    std::vector<ResourceChange> _resources;
    std::vector<Diagnostic> _diagnostics;
    std::vector<LogLine> _logs;
    std::vector<Line> _lines;

    ViewMode _mode;
    int _cursor = 0;
    int _offset = 0;
    int _width = 80;
    int _height = 24;
    bool _dirty = false;
    bool _following = true;
    bool _done = false;
    bool _hasError = false;
    std::optional<int> _exitCode;

    std::string _prompt;
    std::string _input;
    bool _typing = false;
};

} // namespace tfview
