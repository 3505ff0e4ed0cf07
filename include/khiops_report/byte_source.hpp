#pragma once
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace kr {

// Independent read position over a ByteSource.
class ByteCursor {
public:
  virtual ~ByteCursor() = default;

  // Reads up to n bytes; returns 0 at end of source. Throws MalformedInputError on I/O failure.
  virtual std::size_t read(char* dst, std::size_t n) = 0;
  virtual void seek(std::uint64_t offset) = 0;
  virtual std::uint64_t tell() const = 0;
};

// Read-only, seekable byte source shared by the index pass and every
// later detail resolution. It must not change while a Report is open.
class ByteSource {
public:
  virtual ~ByteSource() = default;

  virtual std::unique_ptr<ByteCursor> open_cursor() const = 0;
  virtual std::uint64_t size() const = 0;
  virtual std::string describe() const = 0;
};

class FileSource : public ByteSource {
public:
  // Throws MalformedInputError when the file cannot be opened.
  explicit FileSource(std::string path);

  std::unique_ptr<ByteCursor> open_cursor() const override;
  std::uint64_t size() const override { return size_; }
  std::string describe() const override { return path_; }

private:
  std::string path_;
  std::uint64_t size_{0};
};

class MemorySource : public ByteSource {
public:
  explicit MemorySource(std::string bytes, std::string name = "<memory>");

  std::unique_ptr<ByteCursor> open_cursor() const override;
  std::uint64_t size() const override { return bytes_->size(); }
  std::string describe() const override { return name_; }

  std::string_view bytes() const noexcept { return *bytes_; }

private:
  std::shared_ptr<const std::string> bytes_;
  std::string name_;
};

}
