#pragma once
/** @file  FileLogger.hpp
 *  @brief Buffered CSV writer for host FS.
 *
 *  © 2025 ANOD Middleware authors — MIT-licensed.
 */

#include <cstdio>
#include <string>
#include <vector>

namespace anod {
  namespace io {

    /**
 * @class FileLogger
 * @brief RAII wrapper that opens a file, buffers writes, and flushes on demand.
 *
 *  * Intended for run logs and sample tables (10 kB – 10 MB).
 *  * Uses `std::fwrite` in 4 kB chunks.
 */
    class FileLogger {
    public:
      FileLogger() = default;
      ~FileLogger(); ///< flush + fclose

      //---public API------------------------------------------------------
      /** @returns false if path cannot be opened writable (truncates an existing file). */
      bool open(const std::string& path);

      /** Queues one CSV line (caller includes trailing '\n'); false if not open or flush failed. */
      bool write(const std::string& csv);

      /** Force-flush buffer to disk; returns true on success. */
      bool flush();

      void close();

      bool isOpen() const { return fp_ != nullptr; }
      const std::string& path() const { return path_; }

      /** Quotes a CSV field when it contains a separator, quote or newline. */
      static std::string escape(const std::string& field);

      //---non-copyable, move-enabled---------------------------------------
      FileLogger(const FileLogger&) = delete;
      FileLogger& operator=(const FileLogger&) = delete;
      FileLogger(FileLogger&& other) noexcept;
      FileLogger& operator=(FileLogger&& other) noexcept;

    private:
      static constexpr std::size_t kChunkSize = 4096;

      std::FILE* fp_{ nullptr };
      std::string path_{};
      std::vector<char> buffer_;
    };

  } // namespace io
} // namespace anod
