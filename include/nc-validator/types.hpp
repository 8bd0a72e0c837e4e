#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace ncvalidator {

enum class DataType {
  Int8,
  UInt8,
  Char,
  Int16,
  UInt16,
  Int32,
  UInt32,
  Int64,
  UInt64,
  Float32,
  Float64,
  String,
  UserDefined
};

// "float64", "int32", ... ; user-defined types render as "user:<name>"
std::string data_type_name(DataType type, const std::string &type_name = "");
std::optional<DataType> parse_data_type(const std::string &name);

struct VariableSchema {
  DataType datatype = DataType::Float64;
  std::string type_name; // only set for DataType::UserDefined
  std::vector<std::string> dimensions;
  std::vector<std::string> attributes;

  std::string type_string() const {
    return data_type_name(datatype, type_name);
  }
};

/// Schema of an opened structured-data file. Entries keep file order.
struct DataFile {
  std::string source;
  std::vector<std::string> global_attributes;
  std::vector<std::pair<std::string, std::size_t>> dimensions;
  std::vector<std::pair<std::string, VariableSchema>> variables;

  bool has_global_attribute(const std::string &name) const;
  bool has_dimension(const std::string &name) const;
  const VariableSchema *find_variable(const std::string &name) const;
};

enum class DiscrepancyKind {
  MissingGlobalAttribute,
  MissingDimension,
  MissingVariable,
  DatatypeMismatch,
  DimensionOrderMismatch,
  MissingVariableAttribute
};

std::string discrepancy_kind_name(DiscrepancyKind kind);

struct Discrepancy {
  DiscrepancyKind kind;
  std::vector<std::string> subject; // variable first, then attribute
  std::string detail;

  bool operator==(const Discrepancy &other) const {
    return kind == other.kind && subject == other.subject &&
           detail == other.detail;
  }
};

struct ValidationReport {
  bool valid = true;
  std::vector<Discrepancy> discrepancies;
  std::size_t global_attributes_matched = 0;
  std::size_t global_attributes_required = 0;
  std::size_t dimensions_matched = 0;
  std::size_t dimensions_required = 0;

  std::size_t count(DiscrepancyKind kind) const;

  bool operator==(const ValidationReport &other) const {
    return valid == other.valid && discrepancies == other.discrepancies &&
           global_attributes_matched == other.global_attributes_matched &&
           global_attributes_required == other.global_attributes_required &&
           dimensions_matched == other.dimensions_matched &&
           dimensions_required == other.dimensions_required;
  }
};

enum class OpenErrorKind { FileNotFound, FileUnreadable, InvalidSchema };

struct OpenError {
  OpenErrorKind kind;
  std::string path;
  std::string message;
};

/// Either an opened schema or the reason it could not be opened.
struct OpenResult {
  std::optional<DataFile> file;
  std::optional<OpenError> error;

  bool ok() const { return file.has_value(); }

  static OpenResult success(DataFile data) {
    OpenResult result;
    result.file = std::move(data);
    return result;
  }

  static OpenResult failure(OpenErrorKind kind, const std::string &path,
                            const std::string &message) {
    OpenResult result;
    result.error = OpenError{kind, path, message};
    return result;
  }
};

} // namespace ncvalidator
