#include "byte_stream.hpp"
#include "config.hpp"
#include <algorithm>
#include <cstring>
#include <vector>

Result<size_t> readFull(ByteSource& source, char* buffer, size_t length) {
    size_t total = 0;
    while (total < length) {
        Result<size_t> got = source.read(buffer + total, length - total);
        if (!got.success) return got;
        if (got.data == 0) break;
        total += got.data;
    }
    return Result<size_t>::Ok(total);
}

Result<uint64_t> copyStream(ByteSource& source, ByteSink& sink) {
    std::vector<char> buffer(Config::COPY_BUFFER_SIZE);
    uint64_t total = 0;
    for (;;) {
        Result<size_t> got = source.read(buffer.data(), buffer.size());
        if (!got.success) return Result<uint64_t>::From(got);
        if (got.data == 0) break;
        Result<void> written = sink.write(buffer.data(), got.data);
        if (!written.success) return Result<uint64_t>::From(written);
        total += got.data;
    }
    return Result<uint64_t>::Ok(total);
}

FileSource::FileSource(const std::string& path) : path_(path), file_(path, std::ios::binary) {}

bool FileSource::isOpen() const {
    return file_.is_open();
}

Result<size_t> FileSource::read(char* buffer, size_t length) {
    if (!file_.is_open()) {
        return Result<size_t>::Error("Failed to open file: " + path_, ErrorCode::Io);
    }
    file_.read(buffer, static_cast<std::streamsize>(length));
    if (file_.bad()) {
        return Result<size_t>::Error("Read error on " + path_, ErrorCode::Io);
    }
    return Result<size_t>::Ok(static_cast<size_t>(file_.gcount()));
}

FileSink::FileSink(const std::string& path) : path_(path), file_(path, std::ios::binary | std::ios::trunc) {}

bool FileSink::isOpen() const {
    return file_.is_open();
}

Result<void> FileSink::write(const char* data, size_t length) {
    if (!file_.is_open()) {
        return Result<void>::Error("Failed to open file for writing: " + path_, ErrorCode::Io);
    }
    file_.write(data, static_cast<std::streamsize>(length));
    if (!file_) {
        return Result<void>::Error("Write error on " + path_, ErrorCode::Io);
    }
    return Result<void>::Ok();
}

Result<void> FileSink::close() {
    if (!file_.is_open()) {
        return Result<void>::Error("File not open: " + path_, ErrorCode::Io);
    }
    file_.flush();
    bool flushed = static_cast<bool>(file_);
    file_.close();
    if (!flushed || file_.fail()) {
        return Result<void>::Error("Failed to flush " + path_, ErrorCode::Io);
    }
    return Result<void>::Ok();
}

Result<size_t> BufferSource::read(char* buffer, size_t length) {
    size_t n = std::min(length, data_.size() - offset_);
    std::memcpy(buffer, data_.data() + offset_, n);
    offset_ += n;
    return Result<size_t>::Ok(n);
}
