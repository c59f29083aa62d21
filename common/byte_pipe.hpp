#pragma once
#include "byte_stream.hpp"
#include "config.hpp"
#include <condition_variable>
#include <mutex>
#include <vector>

// Bounded in-memory channel joining a producer thread and a consumer thread.
// write() blocks once `capacity` bytes are waiting. Either side can close with
// an error, which unblocks and fails the other side on its next call.
class BytePipe {
public:
    explicit BytePipe(size_t capacity = Config::PIPE_CAPACITY);

    BytePipe(const BytePipe&) = delete;
    BytePipe& operator=(const BytePipe&) = delete;

    ByteSource& reader() { return reader_; }
    ByteSink& writer() { return writer_; }

    Result<size_t> read(char* buffer, size_t length);
    Result<void> write(const char* data, size_t length);

    // producer finished; the reader drains what is buffered, then sees
    // end of stream (status ok) or the error
    void closeWrite(const Result<void>& status = Result<void>::Ok());

    // consumer gave up; pending and future writes fail with status
    void closeRead(const Result<void>& status);

private:
    class Reader : public ByteSource {
    public:
        explicit Reader(BytePipe& pipe) : pipe_(pipe) {}
        Result<size_t> read(char* buffer, size_t length) override { return pipe_.read(buffer, length); }
    private:
        BytePipe& pipe_;
    };

    class Writer : public ByteSink {
    public:
        explicit Writer(BytePipe& pipe) : pipe_(pipe) {}
        Result<void> write(const char* data, size_t length) override { return pipe_.write(data, length); }
    private:
        BytePipe& pipe_;
    };

    std::vector<char> ring_;
    size_t head_ = 0;     // next byte to read
    size_t size_ = 0;     // bytes buffered

    std::mutex mutex_;
    std::condition_variable readable_;
    std::condition_variable writable_;

    bool writeClosed_ = false;
    bool readClosed_ = false;
    Result<void> writeStatus_ = Result<void>::Ok();
    Result<void> readStatus_ = Result<void>::Ok();

    Reader reader_;
    Writer writer_;
};
