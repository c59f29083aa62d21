#include "byte_pipe.hpp"
#include <algorithm>
#include <cstring>

BytePipe::BytePipe(size_t capacity)
    : ring_(capacity == 0 ? 1 : capacity), reader_(*this), writer_(*this) {}

Result<void> BytePipe::write(const char* data, size_t length) {
    std::unique_lock<std::mutex> lock(mutex_);
    while (length > 0) {
        writable_.wait(lock, [this]() { return readClosed_ || size_ < ring_.size(); });
        if (readClosed_) {
            if (!readStatus_.success) return readStatus_;
            return Result<void>::Error("pipe closed by reader", ErrorCode::Io);
        }
        if (writeClosed_) {
            return Result<void>::Error("write on closed pipe", ErrorCode::Io);
        }

        size_t tail = (head_ + size_) % ring_.size();
        size_t room = std::min(ring_.size() - size_, ring_.size() - tail);
        size_t n = std::min(length, room);
        std::memcpy(ring_.data() + tail, data, n);
        size_ += n;
        data += n;
        length -= n;
        readable_.notify_one();
    }
    return Result<void>::Ok();
}

Result<size_t> BytePipe::read(char* buffer, size_t length) {
    if (length == 0) return Result<size_t>::Ok(0);

    std::unique_lock<std::mutex> lock(mutex_);
    readable_.wait(lock, [this]() { return size_ > 0 || writeClosed_ || readClosed_; });

    if (readClosed_) {
        return Result<size_t>::Error("read on closed pipe", ErrorCode::Io);
    }
    if (size_ == 0) {
        // writer is done
        if (!writeStatus_.success) return Result<size_t>::From(writeStatus_);
        return Result<size_t>::Ok(0);
    }

    size_t contiguous = std::min(size_, ring_.size() - head_);
    size_t n = std::min(length, contiguous);
    std::memcpy(buffer, ring_.data() + head_, n);
    head_ = (head_ + n) % ring_.size();
    size_ -= n;
    writable_.notify_one();
    return Result<size_t>::Ok(n);
}

void BytePipe::closeWrite(const Result<void>& status) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (writeClosed_) return;
        writeClosed_ = true;
        writeStatus_ = status;
    }
    readable_.notify_all();
    writable_.notify_all();
}

void BytePipe::closeRead(const Result<void>& status) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (readClosed_) return;
        readClosed_ = true;
        readStatus_ = status.success ? Result<void>::Error("pipe closed by reader", ErrorCode::Io) : status;
    }
    readable_.notify_all();
    writable_.notify_all();
}
