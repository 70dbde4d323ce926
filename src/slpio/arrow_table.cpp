#include "arrow_table.hpp"

#include <optional>
#include <string>
#include <utility>

#include <arrow/array.h>
#include <arrow/builder.h>
#include <arrow/buffer.h>
#include <arrow/io/memory.h>
#include <arrow/ipc/reader.h>
#include <arrow/ipc/writer.h>
#include <arrow/record_batch.h>
#include <arrow/result.h>
#include <arrow/status.h>
#include <arrow/type.h>
#include <redlog.hpp>

#include "slpbase/worker_pool.hpp"

namespace slp::io {

namespace {

status from_arrow(const arrow::Status& st, error_code code, const std::string& context) {
  return make_status(code, context + ": " + st.ToString());
}

std::shared_ptr<arrow::DataType> arrow_type(column_type type) {
  switch (type) {
  case column_type::boolean:
    return arrow::boolean();
  case column_type::i8:
    return arrow::int8();
  case column_type::u8:
    return arrow::uint8();
  case column_type::u16:
    return arrow::uint16();
  case column_type::i32:
    return arrow::int32();
  case column_type::u32:
    return arrow::uint32();
  case column_type::u64:
    return arrow::uint64();
  case column_type::f32:
    return arrow::float32();
  }
  return nullptr;
}

std::optional<column_type> column_type_of(arrow::Type::type id) {
  switch (id) {
  case arrow::Type::BOOL:
    return column_type::boolean;
  case arrow::Type::INT8:
    return column_type::i8;
  case arrow::Type::UINT8:
    return column_type::u8;
  case arrow::Type::UINT16:
    return column_type::u16;
  case arrow::Type::INT32:
    return column_type::i32;
  case arrow::Type::UINT32:
    return column_type::u32;
  case arrow::Type::UINT64:
    return column_type::u64;
  case arrow::Type::FLOAT:
    return column_type::f32;
  default:
    return std::nullopt;
  }
}

template <typename builder_type, typename getter>
arrow::Result<std::shared_ptr<arrow::Array>> build_array(const column& source, getter get) {
  builder_type builder;
  ARROW_RETURN_NOT_OK(builder.Reserve(static_cast<int64_t>(source.rows())));
  for (size_t row = 0; row < source.rows(); ++row) {
    if (const auto value = get(row)) {
      builder.UnsafeAppend(static_cast<typename builder_type::value_type>(*value));
    } else {
      builder.UnsafeAppendNull();
    }
  }
  return builder.Finish();
}

arrow::Result<std::shared_ptr<arrow::Array>> to_arrow_array(const column& source) {
  auto as_int = [&](size_t row) { return source.int_at(row); };
  auto as_uint = [&](size_t row) { return source.uint_at(row); };
  switch (source.type()) {
  case column_type::boolean:
    return build_array<arrow::BooleanBuilder>(source, [&](size_t row) { return source.bool_at(row); });
  case column_type::i8:
    return build_array<arrow::Int8Builder>(source, as_int);
  case column_type::u8:
    return build_array<arrow::UInt8Builder>(source, as_uint);
  case column_type::u16:
    return build_array<arrow::UInt16Builder>(source, as_uint);
  case column_type::i32:
    return build_array<arrow::Int32Builder>(source, as_int);
  case column_type::u32:
    return build_array<arrow::UInt32Builder>(source, as_uint);
  case column_type::u64:
    return build_array<arrow::UInt64Builder>(source, as_uint);
  case column_type::f32:
    return build_array<arrow::FloatBuilder>(source, [&](size_t row) { return source.float_at(row); });
  }
  return arrow::Status::Invalid("column ", source.name(), " has no arrow type");
}

template <typename array_type, typename setter>
void copy_values(const arrow::Array& source, size_t base, column& target, setter set) {
  const auto& typed = static_cast<const array_type&>(source);
  for (int64_t i = 0; i < typed.length(); ++i) {
    const size_t row = base + static_cast<size_t>(i);
    if (typed.IsNull(i)) {
      target.set_null(row);
    } else {
      set(row, typed.Value(i));
    }
  }
}

void copy_array(const arrow::Array& source, size_t base, column& target) {
  auto set_int = [&](size_t row, int64_t value) { target.set_int(row, value); };
  auto set_uint = [&](size_t row, uint64_t value) { target.set_uint(row, value); };
  switch (target.type()) {
  case column_type::boolean:
    copy_values<arrow::BooleanArray>(source, base, target, [&](size_t row, bool value) { target.set_bool(row, value); });
    break;
  case column_type::i8:
    copy_values<arrow::Int8Array>(source, base, target, set_int);
    break;
  case column_type::u8:
    copy_values<arrow::UInt8Array>(source, base, target, set_uint);
    break;
  case column_type::u16:
    copy_values<arrow::UInt16Array>(source, base, target, set_uint);
    break;
  case column_type::i32:
    copy_values<arrow::Int32Array>(source, base, target, set_int);
    break;
  case column_type::u32:
    copy_values<arrow::UInt32Array>(source, base, target, set_uint);
    break;
  case column_type::u64:
    copy_values<arrow::UInt64Array>(source, base, target, set_uint);
    break;
  case column_type::f32:
    copy_values<arrow::FloatArray>(source, base, target, [&](size_t row, float value) { target.set_float(row, value); });
    break;
  }
}

arrow::Result<std::shared_ptr<arrow::util::Codec>> make_codec(column_codec codec, int level) {
  const auto type = codec == column_codec::lz4 ? arrow::Compression::LZ4_FRAME : arrow::Compression::ZSTD;
  ARROW_ASSIGN_OR_RAISE(auto created, arrow::util::Codec::Create(type, level));
  return std::shared_ptr<arrow::util::Codec>(std::move(created));
}

arrow::Result<std::shared_ptr<arrow::Buffer>> write_ipc(const arrow::Table& table, const arrow_write_options& options) {
  auto ipc_options = arrow::ipc::IpcWriteOptions::Defaults();
  ipc_options.use_threads = false;
  if (options.codec != column_codec::none) {
    ARROW_ASSIGN_OR_RAISE(ipc_options.codec, make_codec(options.codec, options.compression_level));
  }

  ARROW_ASSIGN_OR_RAISE(auto sink, arrow::io::BufferOutputStream::Create());
  ARROW_ASSIGN_OR_RAISE(auto writer, arrow::ipc::MakeFileWriter(sink, table.schema(), ipc_options));
  ARROW_RETURN_NOT_OK(writer->WriteTable(table));
  ARROW_RETURN_NOT_OK(writer->Close());
  return sink->Finish();
}

struct ipc_contents {
  std::shared_ptr<arrow::Schema> schema;
  std::vector<std::shared_ptr<arrow::RecordBatch>> batches;
};

arrow::Result<ipc_contents> read_ipc(std::span<const uint8_t> data) {
  auto buffer = std::make_shared<arrow::Buffer>(data.data(), static_cast<int64_t>(data.size()));
  auto input = std::make_shared<arrow::io::BufferReader>(buffer);
  ARROW_ASSIGN_OR_RAISE(auto reader, arrow::ipc::RecordBatchFileReader::Open(input));

  ipc_contents contents;
  contents.schema = reader->schema();
  contents.batches.reserve(static_cast<size_t>(reader->num_record_batches()));
  for (int i = 0; i < reader->num_record_batches(); ++i) {
    ARROW_ASSIGN_OR_RAISE(auto batch, reader->ReadRecordBatch(i));
    ARROW_RETURN_NOT_OK(batch->ValidateFull());
    if (!batch->schema()->Equals(*contents.schema)) {
      return arrow::Status::Invalid("record batch ", i, " does not match the file schema");
    }
    contents.batches.push_back(std::move(batch));
  }
  return contents;
}

} // namespace

status to_arrow_table(const column_table& table, size_t workers, std::shared_ptr<arrow::Table>& out) {
  for (const auto& entry : table.columns) {
    if (entry.rows() != table.rows) {
      return make_status(
          error_code::invalid_argument, "column " + entry.name() + " has " + std::to_string(entry.rows()) +
                                            " rows, table has " + std::to_string(table.rows)
      );
    }
  }

  arrow::ArrayVector columns(table.columns.size());
  std::vector<arrow::Status> failures(table.columns.size());
  util::run_indexed(table.columns.size(), workers, [&](size_t index) {
    auto converted = to_arrow_array(table.columns[index]);
    if (converted.ok()) {
      columns[index] = converted.MoveValueUnsafe();
    } else {
      failures[index] = converted.status();
    }
  });

  arrow::FieldVector fields;
  fields.reserve(table.columns.size());
  for (size_t i = 0; i < table.columns.size(); ++i) {
    if (!failures[i].ok()) {
      return from_arrow(failures[i], error_code::io_error, "column " + table.columns[i].name());
    }
    fields.push_back(arrow::field(table.columns[i].name(), arrow_type(table.columns[i].type()), true));
  }
  out = arrow::Table::Make(arrow::schema(std::move(fields)), std::move(columns), static_cast<int64_t>(table.rows));
  return ok_status();
}

status write_arrow_file(const column_table& table, const arrow_write_options& options, std::vector<uint8_t>& out) {
  auto log = redlog::get_logger("slpkit.columns");

  std::shared_ptr<arrow::Table> converted;
  auto st = to_arrow_table(table, options.workers, converted);
  if (!st.ok()) {
    return st;
  }

  auto written = write_ipc(*converted, options);
  if (!written.ok()) {
    log.err("arrow ipc write failed", redlog::field("error", written.status().ToString()));
    return from_arrow(written.status(), error_code::io_error, "arrow ipc write");
  }
  const auto& buffer = *written;
  out.assign(buffer->data(), buffer->data() + buffer->size());

  log.dbg(
      "arrow table written", redlog::field("rows", table.rows), redlog::field("columns", table.columns.size()),
      redlog::field("bytes", out.size())
  );
  return ok_status();
}

status read_arrow_file(std::span<const uint8_t> data, column_table& out) {
  auto contents = read_ipc(data);
  if (!contents.ok()) {
    return from_arrow(contents.status(), error_code::malformed_header, "not a readable arrow file");
  }
  const auto& schema = *contents->schema;
  const auto& batches = contents->batches;

  // an empty table is written as a schema without batches
  uint64_t rows = 0;
  for (const auto& batch : batches) {
    rows += static_cast<uint64_t>(batch->num_rows());
  }

  column_table table;
  table.rows = rows;
  table.columns.reserve(static_cast<size_t>(schema.num_fields()));
  for (int i = 0; i < schema.num_fields(); ++i) {
    const auto& field = schema.field(i);
    const auto type = column_type_of(field->type()->id());
    if (!type) {
      return make_status(
          error_code::malformed_header, "column " + field->name() + " has unsupported type " + field->type()->ToString()
      );
    }
    column entry(field->name(), *type, static_cast<size_t>(rows));
    size_t base = 0;
    for (const auto& batch : batches) {
      copy_array(*batch->column(i), base, entry);
      base += static_cast<size_t>(batch->num_rows());
    }
    table.columns.push_back(std::move(entry));
  }

  out = std::move(table);
  return ok_status();
}

} // namespace slp::io
