/* @file FileLogger.cpp
 * @brief chunked CSV writer used by the event log and the sample recorder
 *
 * © 2025 ANOD Middleware authors — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <iostream>
#include <utility>

// ANOD headers
#include "io/FileLogger.hpp"

using namespace anod::io;

FileLogger::~FileLogger() { close(); }

FileLogger::FileLogger(FileLogger&& other) noexcept
    : fp_(std::exchange(other.fp_, nullptr)), path_(std::move(other.path_)),
      buffer_(std::move(other.buffer_)) {}

FileLogger& FileLogger::operator=(FileLogger&& other) noexcept {
  if (this != &other) {
    close();
    fp_ = std::exchange(other.fp_, nullptr);
    path_ = std::move(other.path_);
    buffer_ = std::move(other.buffer_);
  }
  return *this;
}

bool FileLogger::open(const std::string& path) {
  close();
  fp_ = std::fopen(path.c_str(), "w");
  if (fp_ == nullptr) {
    std::cerr << "Error " << errno << " from fopen(" << path << "): " << strerror(errno) << "\n";
    return false;
  }
  path_ = path;
  buffer_.reserve(kChunkSize);
  return true;
}

bool FileLogger::write(const std::string& csv) {
  if (fp_ == nullptr)
    return false;

  buffer_.insert(buffer_.end(), csv.begin(), csv.end());
  if (buffer_.size() >= kChunkSize)
    return flush();
  return true;
}

bool FileLogger::flush() {
  if (fp_ == nullptr)
    return false;

  std::size_t offset = 0;
  while (offset < buffer_.size()) {
    const std::size_t chunk = std::min(kChunkSize, buffer_.size() - offset);
    if (std::fwrite(buffer_.data() + offset, 1, chunk, fp_) != chunk) {
      std::cerr << "Error " << errno << " from fwrite(" << path_ << "): " << strerror(errno)
                << "\n";
      buffer_.erase(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(offset));
      return false;
    }
    offset += chunk;
  }
  buffer_.clear();
  return std::fflush(fp_) == 0;
}

void FileLogger::close() {
  if (fp_ == nullptr)
    return;
  if (!flush())
    std::cerr << "[FileLogger] data lost while closing " << path_ << "\n";
  std::fclose(fp_);
  fp_ = nullptr;
  buffer_.clear(); // unflushable rows must not leak into the next file
}

std::string FileLogger::escape(const std::string& field) {
  if (field.find_first_of(",\"\r\n") == std::string::npos)
    return field;

  std::string out = "\"";
  for (char c : field) {
    if (c == '"')
      out += '"';
    out += c;
  }
  out += '"';
  return out;
}
