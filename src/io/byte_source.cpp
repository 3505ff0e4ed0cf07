#include "khiops_report/byte_source.hpp"
#include "khiops_report/errors.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <system_error>
#include <sys/types.h>

namespace kr {

namespace {

class FileCursor : public ByteCursor {
public:
  explicit FileCursor(const std::string& path) : f_(std::fopen(path.c_str(), "rb")) {
    if (!f_) throw MalformedInputError("cannot open '" + path + "': " + std::strerror(errno), 0);
  }
  ~FileCursor() override { if (f_) std::fclose(f_); }

  std::size_t read(char* dst, std::size_t n) override {
    std::size_t got = std::fread(dst, 1, n, f_);
    if (got < n && std::ferror(f_)) {
      int e = errno;
      throw MalformedInputError(std::string("read failed: ") + std::strerror(e), pos_ + got);
    }
    pos_ += got;
    return got;
  }

  void seek(std::uint64_t offset) override {
    if (fseeko(f_, static_cast<off_t>(offset), SEEK_SET) != 0) {
      throw MalformedInputError(std::string("seek failed: ") + std::strerror(errno), offset);
    }
    pos_ = offset;
  }

  std::uint64_t tell() const override { return pos_; }

private:
  std::FILE* f_;
  std::uint64_t pos_{0};
};

class MemoryCursor : public ByteCursor {
public:
  explicit MemoryCursor(std::shared_ptr<const std::string> bytes) : bytes_(std::move(bytes)) {}

  std::size_t read(char* dst, std::size_t n) override {
    if (pos_ >= bytes_->size()) return 0;
    std::size_t got = std::min<std::size_t>(n, bytes_->size() - pos_);
    std::memcpy(dst, bytes_->data() + pos_, got);
    pos_ += got;
    return got;
  }

  void seek(std::uint64_t offset) override { pos_ = offset; }
  std::uint64_t tell() const override { return pos_; }

private:
  std::shared_ptr<const std::string> bytes_;
  std::uint64_t pos_{0};
};

}

FileSource::FileSource(std::string path) : path_(std::move(path)) {
  std::error_code ec;
  auto sz = std::filesystem::file_size(path_, ec);
  if (ec) throw MalformedInputError("cannot stat '" + path_ + "': " + ec.message(), 0);
  size_ = static_cast<std::uint64_t>(sz);
}

std::unique_ptr<ByteCursor> FileSource::open_cursor() const {
  return std::make_unique<FileCursor>(path_);
}

MemorySource::MemorySource(std::string bytes, std::string name)
  : bytes_(std::make_shared<const std::string>(std::move(bytes))), name_(std::move(name)) {}

std::unique_ptr<ByteCursor> MemorySource::open_cursor() const {
  return std::make_unique<MemoryCursor>(bytes_);
}

}
