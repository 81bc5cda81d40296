// SPDX-License-Identifier: Apache-2.0
#include <core/Log.hpp>

#include <stream/StreamReader.hpp>

#include <atomic>
#include <thread>
#include <vector>

namespace tfview
{

struct StreamReader::Impl
{
    InputSource& source;
    StreamReaderConfig config;
    MessageQueue<StreamMessage> queue;
    std::atomic<bool> finished = false;
    std::jthread worker;

    Impl(InputSource& source, StreamReaderConfig config):
        source(source), config(std::move(config)), queue(this->config.queueCapacity)
    {
    }

    /// Pushes all messages in order; false once cancelled.
    auto publish(std::vector<StreamMessage>& messages, std::stop_token const& stopToken) -> bool
    {
        for (auto& message: messages)
            if (!queue.push(std::move(message), stopToken))
                return false;
        return true;
    }

    void run(std::stop_token const& stopToken)
    {
        auto classifier = LineClassifier(config.classifier);
        auto buffer = std::vector<char>(config.readBufferSize == 0 ? 4096 : config.readBufferSize);
        auto totalBytes = std::size_t { 0 };

        while (!stopToken.stop_requested())
        {
            auto const result = source.read(buffer, config.readTimeout);
            if (!result)
            {
                log::warning("Input read failed, treating as end of stream: {}", result.error());
                break;
            }
            if (result->status == ReadStatus::EndOfStream)
                break;
            if (result->status == ReadStatus::Timeout)
                continue;

            totalBytes += result->size;
            auto messages = classifier.feed(std::string_view(buffer.data(), result->size));
            if (!publish(messages, stopToken))
                break;
        }

        if (!stopToken.stop_requested())
        {
            auto messages = classifier.finish();
            static_cast<void>(publish(messages, stopToken));
            log::debug("Input finished after {} bytes", totalBytes);
        }
        else
        {
            log::debug("Reader cancelled after {} bytes", totalBytes);
        }

        queue.close();
        finished = true;
    }
};

StreamReader::StreamReader(InputSource& source, StreamReaderConfig config):
    _impl(std::make_unique<Impl>(source, std::move(config)))
{
}

StreamReader::~StreamReader()
{
    stop();
}

void StreamReader::start()
{
    if (_impl->worker.joinable())
        return;
    _impl->worker = std::jthread([this](std::stop_token const& token) { _impl->run(token); });
}

void StreamReader::stop()
{
    if (!_impl->worker.joinable())
        return;
    _impl->worker.request_stop();
    _impl->worker.join();
}

auto StreamReader::queue() noexcept -> MessageQueue<StreamMessage>&
{
    return _impl->queue;
}

auto StreamReader::finished() const noexcept -> bool
{
    return _impl->finished;
}

} // namespace tfview
