#include "nc-validator/types.hpp"

#include <algorithm>
#include <map>

namespace ncvalidator {

static const std::map<DataType, std::string> &data_type_names() {
  static const std::map<DataType, std::string> names = {
      {DataType::Int8, "int8"},       {DataType::UInt8, "uint8"},
      {DataType::Char, "char"},       {DataType::Int16, "int16"},
      {DataType::UInt16, "uint16"},   {DataType::Int32, "int32"},
      {DataType::UInt32, "uint32"},   {DataType::Int64, "int64"},
      {DataType::UInt64, "uint64"},   {DataType::Float32, "float32"},
      {DataType::Float64, "float64"}, {DataType::String, "string"}};
  return names;
}

std::string data_type_name(DataType type, const std::string &type_name) {
  if (type == DataType::UserDefined)
    return "user:" + type_name;
  return data_type_names().at(type);
}

std::optional<DataType> parse_data_type(const std::string &name) {
  if (name.rfind("user:", 0) == 0 && name.size() > 5)
    return DataType::UserDefined;
  for (const auto &[type, type_str] : data_type_names()) {
    if (type_str == name)
      return type;
  }
  return std::nullopt;
}

std::string discrepancy_kind_name(DiscrepancyKind kind) {
  switch (kind) {
  case DiscrepancyKind::MissingGlobalAttribute:
    return "MissingGlobalAttribute";
  case DiscrepancyKind::MissingDimension:
    return "MissingDimension";
  case DiscrepancyKind::MissingVariable:
    return "MissingVariable";
  case DiscrepancyKind::DatatypeMismatch:
    return "DatatypeMismatch";
  case DiscrepancyKind::DimensionOrderMismatch:
    return "DimensionOrderMismatch";
  case DiscrepancyKind::MissingVariableAttribute:
    return "MissingVariableAttribute";
  }
  return "Unknown";
}

bool DataFile::has_global_attribute(const std::string &name) const {
  return std::find(global_attributes.begin(), global_attributes.end(),
                   name) != global_attributes.end();
}

bool DataFile::has_dimension(const std::string &name) const {
  return std::any_of(dimensions.begin(), dimensions.end(),
                     [&](const auto &dim) { return dim.first == name; });
}

const VariableSchema *DataFile::find_variable(const std::string &name) const {
  for (const auto &[var_name, var] : variables) {
    if (var_name == name)
      return &var;
  }
  return nullptr;
}

std::size_t ValidationReport::count(DiscrepancyKind kind) const {
  return static_cast<std::size_t>(
      std::count_if(discrepancies.begin(), discrepancies.end(),
                    [kind](const Discrepancy &d) { return d.kind == kind; }));
}

} // namespace ncvalidator
