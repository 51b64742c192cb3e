#include "disk_output_sink.hpp"

#include <system_error>

#include "internal/observability/logging.hpp"
#include "internal/storage/common/arrow_utils.hpp"
#include "internal/util/errors.hpp"

namespace acquisition::storage {

using namespace acquisition::storage::common;

DiskOutputSink::DiskOutputSink(std::filesystem::path final_path, bool fsync)
    : final_path_(std::move(final_path)), tmp_path_(final_path_.string() + ".tmp"), fsync_(fsync) {
}

DiskOutputSink::~DiskOutputSink() {
  if (!closed_) {
    Abort();
  }
}

void DiskOutputSink::CheckWritable() const {
  if (closed_) {
    throw util::InvalidState("output sink already closed: " + final_path_.string());
  }
}

void DiskOutputSink::EnsureOpen() {
  if (out_) {
    return;
  }
  if (final_path_.has_parent_path()) {
    std::filesystem::create_directories(final_path_.parent_path());
  }
  out_      = Unwrap(arrow::io::FileOutputStream::Open(tmp_path_.string()));
  owns_tmp_ = true;
}

void DiskOutputSink::CloseStream() {
  if (!out_) {
    return;
  }
  auto stream = std::move(out_);
  if (fsync_) {
    Unwrap(stream->Flush());
  }
  Unwrap(stream->Close());
}

void DiskOutputSink::Write(const std::uint8_t* data, std::size_t size) {
  CheckWritable();
  EnsureOpen();
  Unwrap(out_->Write(data, static_cast<int64_t>(size)));
  bytes_written_ += size;
}

void DiskOutputSink::Reset() {
  CheckWritable();
  if (out_) {
    auto stream = std::move(out_);
    Unwrap(stream->Close());
  }
  if (owns_tmp_) {
    std::filesystem::remove(tmp_path_);
    owns_tmp_ = false;
  }
  remote_location_.reset();
  bytes_written_ = 0;
}

void DiskOutputSink::SetRemoteLocation(const std::string& path) {
  CheckWritable();
  remote_location_ = path;
}

/*
  Atomic commit:
      write tmp → flush → rename
*/
void DiskOutputSink::Commit() {
  CheckWritable();

  if (remote_location_) {
    if (!std::filesystem::exists(*remote_location_)) {
      throw util::NotFound("delivered file missing: " + remote_location_->string());
    }
    if (out_) {
      auto stream = std::move(out_);
      Unwrap(stream->Close());
    }
    auto in   = Unwrap(arrow::io::ReadableFile::Open(remote_location_->string()));
    auto data = ReadAll(in);
    Unwrap(in->Close());

    bytes_written_ = 0;
    EnsureOpen();
    Unwrap(out_->Write(data->data(), data->size()));
    bytes_written_ = static_cast<std::uint64_t>(data->size());
  } else {
    // an empty payload still produces a file
    EnsureOpen();
  }

  CloseStream();
  std::filesystem::rename(tmp_path_, final_path_);
  owns_tmp_ = false;
  closed_   = true;
}

void DiskOutputSink::Abort() noexcept {
  if (closed_) {
    return;
  }
  closed_ = true;

  if (out_) {
    auto status = out_->Close();
    out_.reset();
    if (!status.ok()) {
      ACQUISITION_LOG_WARN("failed to close aborted output", {observability::StringField("path", tmp_path_.string()),
                                                              observability::StringField("error", status.ToString())});
    }
  }

  if (!owns_tmp_) {
    return;
  }
  owns_tmp_ = false;

  std::error_code ec;
  std::filesystem::remove(tmp_path_, ec);
  if (ec) {
    ACQUISITION_LOG_WARN("failed to remove partial output",
                         {observability::StringField("path", tmp_path_.string()), observability::StringField("error", ec.message())});
  }
}

} // namespace acquisition::storage
