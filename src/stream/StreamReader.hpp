// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <parser/LineClassifier.hpp>
#include <parser/PlanTypes.hpp>
#include <stream/InputSource.hpp>
#include <stream/MessageQueue.hpp>

#include <chrono>
#include <memory>

namespace tfview
{

/// @brief Tunables of the reader thread.
struct StreamReaderConfig
{
    ClassifierOptions classifier;
    std::size_t queueCapacity = 100;
    std::chrono::milliseconds readTimeout { 100 };
    std::size_t readBufferSize = 4096;
};

/// @brief Background producer that turns an InputSource into a queue of StreamMessages.
///
/// Owns one std::jthread that reads from the source, runs a LineClassifier and pushes
/// every message into a bounded queue. The thread checks for cancellation once per read
/// and stops without emitting further messages when asked to. It always closes the queue
/// on exit; the consumer treats a drained queue like a StreamFinished message.
///
/// Read errors end the stream like end-of-file; buffered content is still flushed.
class StreamReader
{
  public:
    /// @param source Must outlive the reader (or its stop()).
    StreamReader(InputSource& source, StreamReaderConfig config);
    ~StreamReader();

    StreamReader(StreamReader const&) = delete;
    auto operator=(StreamReader const&) -> StreamReader& = delete;

    /// @brief Launches the reader thread.
    void start();

    /// @brief Requests cancellation and joins the reader thread.
    void stop();

    /// @brief The queue the consumer pops from.
    [[nodiscard]] auto queue() noexcept -> MessageQueue<StreamMessage>&;

    /// @brief Whether the reader thread has finished.
    [[nodiscard]] auto finished() const noexcept -> bool;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace tfview
