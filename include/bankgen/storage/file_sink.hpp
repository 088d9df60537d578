#pragma once

#include <bankgen/storage/sink.hpp>

#include <arrow/filesystem/api.h>

#include <memory>
#include <string>

namespace bankgen::storage {

/// FileSink over an Arrow filesystem rooted at `root`.
class ArrowFileSink final : public FileSink {
   public:
    ArrowFileSink(std::shared_ptr<arrow::fs::FileSystem> fs, std::string root);

    void write(const Table& rows, const std::string& path, WriteMode mode, FileFormat format,
               const Layout& layout) override;

    [[nodiscard]] auto read(const std::string& path, FileFormat format) -> Table override;

    [[nodiscard]] auto root() const noexcept -> const std::string& { return root_; }
    [[nodiscard]] auto file_system() const noexcept -> arrow::fs::FileSystem& { return *fs_; }

   private:
    std::shared_ptr<arrow::fs::FileSystem> fs_;
    std::string root_;
};

}  // namespace bankgen::storage
