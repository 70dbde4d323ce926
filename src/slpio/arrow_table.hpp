#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <vector>

#include <arrow/table.h>
#include <arrow/util/compression.h>

#include "slpbase/result.hpp"

#include "column_table.hpp"

namespace slp::io {

// IPC body buffer compression
enum class column_codec : uint8_t { none, lz4, zstd };

constexpr int k_default_compression_level = arrow::util::kUseDefaultCompressionLevel;

struct arrow_write_options {
  column_codec codec = column_codec::none;
  int compression_level = k_default_compression_level;
  size_t workers = 1;
};

// Builds one nullable arrow array per column, in column order. Columns are converted on
// up to `workers` threads.
status to_arrow_table(const column_table& table, size_t workers, std::shared_ptr<arrow::Table>& out);

// Arrow IPC file format (Feather v2) in a single record batch. Identical input gives
// identical bytes.
status write_arrow_file(const column_table& table, const arrow_write_options& options, std::vector<uint8_t>& out);

// Every batch is fully validated before a value is copied; anything arrow rejects or
// a column type outside column_type is malformed_header.
status read_arrow_file(std::span<const uint8_t> data, column_table& out);

} // namespace slp::io
