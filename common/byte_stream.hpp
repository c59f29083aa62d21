#pragma once
#include "result.hpp"
#include <cstddef>
#include <cstdint>
#include <fstream>
#include <string>

// Pull side of a byte stream. read() returns the number of bytes placed in
// buffer; 0 means end of stream.
class ByteSource {
public:
    virtual ~ByteSource() = default;
    virtual Result<size_t> read(char* buffer, size_t length) = 0;
};

// Push side of a byte stream.
class ByteSink {
public:
    virtual ~ByteSink() = default;
    virtual Result<void> write(const char* data, size_t length) = 0;
};

// Keeps reading until length bytes arrived or the stream ended. The count
// tells a clean end (0) apart from a short read.
Result<size_t> readFull(ByteSource& source, char* buffer, size_t length);

// Copies source into sink until end of stream.
Result<uint64_t> copyStream(ByteSource& source, ByteSink& sink);

class FileSource : public ByteSource {
public:
    explicit FileSource(const std::string& path);
    bool isOpen() const;
    Result<size_t> read(char* buffer, size_t length) override;

private:
    std::string path_;
    std::ifstream file_;
};

class FileSink : public ByteSink {
public:
    explicit FileSink(const std::string& path);
    bool isOpen() const;
    Result<void> write(const char* data, size_t length) override;
    // flushes and closes; the only way to learn whether buffered bytes reached the disk
    Result<void> close();

private:
    std::string path_;
    std::ofstream file_;
};

class BufferSource : public ByteSource {
public:
    explicit BufferSource(std::string data) : data_(std::move(data)) {}
    Result<size_t> read(char* buffer, size_t length) override;

private:
    std::string data_;
    size_t offset_ = 0;
};

class BufferSink : public ByteSink {
public:
    Result<void> write(const char* data, size_t length) override {
        data_.append(data, length);
        return Result<void>::Ok();
    }
    const std::string& data() const { return data_; }

private:
    std::string data_;
};
