#pragma once

#include <arrow/io/file.h>

#include <filesystem>
#include <memory>
#include <optional>

#include "internal/storage/output_sink.hpp"

namespace acquisition::storage {

/*
  Disk sink using Arrow IO.

  Properties:
    - writes go to <final>.tmp
    - Commit() renames over the final path
    - optional fsync before rename
*/

class DiskOutputSink final : public OutputSink {
 public:
  DiskOutputSink(std::filesystem::path final_path, bool fsync);
  ~DiskOutputSink() override;

  DiskOutputSink(const DiskOutputSink&)            = delete;
  DiskOutputSink& operator=(const DiskOutputSink&) = delete;

  void Write(const std::uint8_t* data, std::size_t size) override;
  void Reset() override;
  void SetRemoteLocation(const std::string& path) override;
  void Commit() override;
  void Abort() noexcept override;

  std::uint64_t BytesWritten() const override {
    return bytes_written_;
  }

  std::string Describe() const override {
    return final_path_.string();
  }

  const std::filesystem::path& FinalPath() const {
    return final_path_;
  }

 private:
  void EnsureOpen();
  void CloseStream();
  void CheckWritable() const;

  std::filesystem::path final_path_;
  std::filesystem::path tmp_path_;
  bool                  fsync_;

  std::shared_ptr<arrow::io::FileOutputStream> out_;
  std::optional<std::filesystem::path>         remote_location_;

  std::uint64_t bytes_written_ = 0;
  bool          closed_        = false;

  // tmp file created by this sink; never touch another writer's
  bool owns_tmp_ = false;
};

} // namespace acquisition::storage
