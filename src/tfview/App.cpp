// SPDX-License-Identifier: Apache-2.0
#include "App.hpp"

#include <core/Log.hpp>
#include <stream/FdInputSource.hpp>
#include <stream/PtyProcess.hpp>
#include <stream/StreamReader.hpp>
#include <view/PlanRenderer.hpp>
#include <view/ViewModel.hpp>

#include <atomic>
#include <chrono>
#include <csignal>
#include <format>
#include <fstream>
#include <iostream>
#include <optional>
#include <print>
#include <string>
#include <utility>
#include <vector>

#include <unistd.h>

#include <tui/Terminal.hpp>

namespace tfview
{

namespace
{
    // SIGTERM and SIGHUP request an orderly shutdown; the main loop polls this flag.
    volatile std::sig_atomic_t gTerminationRequested = 0; // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)

    void terminationHandler(int /*sig*/)
    {
        gTerminationRequested = 1;
    }

    struct PendingLog
    {
        log::Level level;
        std::string message;
    };
} // namespace

struct App::Impl
{
    ViewerConfig config;
    std::vector<std::string> command;

    tui::Terminal terminal;
    PlanRenderer renderer;
    ViewModel model;

    std::unique_ptr<PtyProcess> pty;
    std::unique_ptr<FdInputSource> pipe;
    std::unique_ptr<StreamReader> reader;

    // Log sink state. Guarded by the logging mutex, which is held while the callback runs.
    std::ofstream logFile;
    std::vector<PendingLog> pendingLogs;
    std::atomic<bool> tuiActive = false;

    bool running = true;
    bool streamEndSeen = false;
    bool exitReported = false;
    bool needsRender = true;

    Impl(ViewerConfig cfg, std::vector<std::string> cmd):
        config(std::move(cfg)),
        command(std::move(cmd)),
        model(ViewModelOptions {
            .interactive = !command.empty(),
            .startInLogView = config.startInLogView,
            .mouseScrollLines = config.mouseScrollLines,
        })
    {
    }

    [[nodiscard]] auto source() noexcept -> InputSource&
    {
        if (pty)
            return *pty;
        return *pipe;
    }

    // ===== log sink =====

    void installLogCallback()
    {
        if (!config.logFile.empty())
        {
            logFile.open(config.logFile, std::ios::app);
            if (!logFile.is_open())
                std::println(stderr, "Cannot open log file {}, continuing without it", config.logFile);
        }

        log::setCallback([this](log::Level level, std::string_view message) {
            if (logFile.is_open())
            {
                logFile << std::format("[{}] {}\n", log::levelPrefix(level), message);
                logFile.flush();
            }

            if (!tuiActive.load(std::memory_order_relaxed))
                std::println(stderr, "[{}] {}", log::levelPrefix(level), message);
            else if (level <= log::Level::Warning)
                pendingLogs.push_back(PendingLog { .level = level, .message = std::string(message) });
        });
    }

    /// @brief Restores the stderr sink and prints what was hidden behind the alternate screen.
    void replayPendingLogs()
    {
        log::setCallback(nullptr);
        for (auto const& entry: pendingLogs)
            std::println(stderr, "[{}] {}", log::levelPrefix(entry.level), entry.message);
        pendingLogs.clear();
    }

    // ===== startup =====

    [[nodiscard]] auto openSource() -> VoidResult
    {
        if (command.empty())
        {
            if (::isatty(STDIN_FILENO))
                return makeError(ErrorCode::InvalidArgument,
                                 "No input: pipe a plan into tfview or pass a command to run");
            pipe = std::make_unique<FdInputSource>(STDIN_FILENO);
            return {};
        }

        pty = std::make_unique<PtyProcess>();
        auto const result = pty->start(PtyProcessConfig {
            .argv = command,
            .columns = terminal.columns(),
            .rows = terminal.rows(),
        });
        if (!result)
            return std::unexpected(result.error());

        log::info("Started {}", command.front());
        return {};
    }

    void startReader()
    {
        auto classifier = ClassifierOptions {};
        classifier.promptSentinels = config.promptSentinels;

        reader = std::make_unique<StreamReader>(
            source(),
            StreamReaderConfig {
                .classifier = std::move(classifier),
                .queueCapacity = static_cast<std::size_t>(config.queueCapacity),
                .readTimeout = std::chrono::milliseconds(config.readTimeoutMs),
            });
        reader->start();
    }

    // ===== stream =====

    void drainQueue()
    {
        auto& queue = reader->queue();

        // Bounded per iteration so a fast producer cannot starve input handling.
        for (auto i = 0; i < config.queueCapacity; ++i)
        {
            auto message = queue.tryPop();
            if (!message)
                break;
            model.apply(std::move(*message));
            needsRender = true;
        }

        if (!streamEndSeen && queue.drained())
        {
            streamEndSeen = true;
            model.streamClosed();
            needsRender = true;
        }
    }

    void checkChildExit()
    {
        if (!pty || exitReported)
            return;

        if (auto const exitCode = pty->pollExit(); exitCode)
        {
            exitReported = true;
            log::info("{} exited with code {}", command.front(), *exitCode);
            model.setExitCode(*exitCode);
            needsRender = true;
        }
    }

    // ===== input =====

    void sendToChild(std::string_view data)
    {
        if (!pty)
            return;
        if (auto const result = pty->write(data); !result)
            log::warning("Failed to forward input: {}", result.error());
    }

    void handleTypingKey(tui::KeyEvent const& key)
    {
        if (key.isCtrl('c'))
        {
            sendToChild("\x03");
            running = false;
            return;
        }

        switch (key.key)
        {
            case tui::Key::Escape: model.cancelInput(); break;
            case tui::Key::Backspace: model.eraseLastInputCharacter(); break;
            case tui::Key::Enter: sendToChild(model.submitInput()); break;
            case tui::Key::Character:
                if (!tui::hasModifier(key.modifiers, tui::Modifier::Ctrl)
                    && !tui::hasModifier(key.modifiers, tui::Modifier::Alt))
                    model.appendInput(key.text);
                break;
            default: break;
        }
    }

    void handleKey(tui::KeyEvent const& key)
    {
        if (model.typing())
        {
            handleTypingKey(key);
            return;
        }

        if (key.is('q') || key.isCtrl('c'))
            running = false;
        else if (key.is('i'))
            static_cast<void>(model.beginInput());
        else if (key.is('l') || key.is('L'))
            model.toggleViewMode();
        else if (key.key == tui::Key::Up || key.is('k'))
            model.moveCursor(-1);
        else if (key.key == tui::Key::Down || key.is('j'))
            model.moveCursor(1);
        else if (key.key == tui::Key::Enter || key.is(' '))
            model.toggleExpandAtCursor();
        else if (key.key == tui::Key::PageUp || key.isCtrl('u'))
            model.pageUp();
        else if (key.key == tui::Key::PageDown || key.isCtrl('d'))
            model.pageDown();
        else if (key.key == tui::Key::Home || key.is('g'))
            model.home();
        else if (key.key == tui::Key::End || key.is('G'))
            model.end();
        else if (key.is('e'))
            model.setAllExpanded(true);
        else if (key.is('c'))
            model.setAllExpanded(false);
    }

    void handleMouse(tui::MouseEvent const& mouse)
    {
        switch (mouse.type)
        {
            case tui::MouseEvent::Type::WheelUp: model.scroll(-1); break;
            case tui::MouseEvent::Type::WheelDown: model.scroll(1); break;
            case tui::MouseEvent::Type::Press:
                if (mouse.button == 0)
                    model.click(mouse.row - 1);
                break;
            case tui::MouseEvent::Type::Release: break;
        }
    }

    void handleResize(tui::ResizeEvent const& resize)
    {
        if (resize.columns <= 0 || resize.rows <= 0)
            return;

        terminal.output().setDimensions(resize.columns, resize.rows);
        model.resize(resize.columns, resize.rows);
        if (pty)
        {
            if (auto const result = pty->resize(resize.columns, resize.rows); !result)
                log::debug("Failed to resize pseudo-terminal: {}", result.error());
        }
    }

    void handleEvent(tui::InputEvent const& event)
    {
        needsRender = true;
        if (auto const* key = std::get_if<tui::KeyEvent>(&event))
            handleKey(*key);
        else if (auto const* mouse = std::get_if<tui::MouseEvent>(&event))
            handleMouse(*mouse);
        else if (auto const* resize = std::get_if<tui::ResizeEvent>(&event))
            handleResize(*resize);
        else if (auto const* paste = std::get_if<tui::PasteEvent>(&event))
        {
            if (model.typing())
                model.appendInput(paste->text);
        }
    }

    // ===== frame =====

    void render()
    {
        auto& output = terminal.output();
        auto sync = output.syncGuard();
        renderer.render(model, output);
        output.flush();
        needsRender = false;
    }

    void shutdown()
    {
        if (reader)
            reader->stop();

        if (pty)
        {
            auto const exitCode = pty->terminate(std::chrono::milliseconds(config.shutdownTimeoutMs));
            if (exitCode && !exitReported)
                log::debug("{} exited with code {}", command.front(), *exitCode);
        }

        terminal.shutdown();
        tuiActive.store(false, std::memory_order_relaxed);
    }
};

App::App(ViewerConfig config, std::vector<std::string> command):
    _impl(std::make_unique<Impl>(std::move(config), std::move(command)))
{
}

App::~App() = default;

auto App::run() -> int
{
    std::cout.flush();
    _impl->installLogCallback();

    auto termResult = _impl->terminal.initialize();
    if (!termResult)
    {
        log::error("Failed to initialize terminal: {}", termResult.error());
        _impl->replayPendingLogs();
        return 1;
    }
    _impl->tuiActive.store(true, std::memory_order_relaxed);

    if (auto const sourceResult = _impl->openSource(); !sourceResult)
    {
        _impl->terminal.shutdown();
        _impl->tuiActive.store(false, std::memory_order_relaxed);
        log::error("{}", sourceResult.error());
        _impl->replayPendingLogs();
        return 1;
    }

    struct sigaction sa {};
    sa.sa_handler = terminationHandler;
    sigemptyset(&sa.sa_mask);
    struct sigaction prevTerm {};
    struct sigaction prevHup {};
    sigaction(SIGTERM, &sa, &prevTerm);
    sigaction(SIGHUP, &sa, &prevHup);

    _impl->model.resize(_impl->terminal.columns(), _impl->terminal.rows());
    _impl->startReader();

    while (_impl->running)
    {
        if (gTerminationRequested)
        {
            log::info("Termination requested");
            break;
        }

        for (auto const& event: _impl->terminal.poll(_impl->config.tickIntervalMs))
        {
            _impl->handleEvent(event);
            if (!_impl->running)
                break;
        }
        if (!_impl->running)
            break;

        _impl->drainQueue();
        _impl->checkChildExit();
        _impl->model.tick();

        if (_impl->needsRender)
            _impl->render();
    }

    _impl->shutdown();
    sigaction(SIGTERM, &prevTerm, nullptr);
    sigaction(SIGHUP, &prevHup, nullptr);
    _impl->replayPendingLogs();
    return 0;
}

} // namespace tfview
