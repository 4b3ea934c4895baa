// test_helpers.hpp: shared table builders for the Scrub test suite.
#pragma once

#include "DataTable.h"
#include "CleaningConfig.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace test_helpers {

inline OptionalCell text(const char* s) { return CellValue(std::string(s)); }
inline OptionalCell num(double v) { return CellValue(v); }
inline OptionalCell integer(int64_t v) { return CellValue(v); }
inline OptionalCell flag(bool v) { return CellValue(v); }
inline OptionalCell na() { return std::nullopt; }

inline DataTable make_table(std::vector<TypedColumn> columns) {
    DataTable table;
    for (auto& col : columns) table.addColumn(std::move(col));
    return table;
}

inline TypedColumn mixed(const std::string& name, const std::vector<OptionalCell>& cells) {
    return makeMixedColumn(name, cells);
}

// Column of repeated doubles, as a loader would hand over a numeric CSV field.
inline TypedColumn mixed_numbers(const std::string& name, const std::vector<double>& values) {
    std::vector<OptionalCell> cells;
    cells.reserve(values.size());
    for (double v : values) cells.push_back(CellValue(v));
    return makeMixedColumn(name, cells);
}

inline const std::vector<double>& numeric_values(const DataTable& table, const std::string& name) {
    return std::get<std::vector<double>>(table.column(name).values);
}

inline const std::vector<std::string>& text_values(const DataTable& table, const std::string& name) {
    return std::get<std::vector<std::string>>(table.column(name).values);
}

inline const std::vector<int64_t>& datetime_values(const DataTable& table, const std::string& name) {
    return std::get<std::vector<int64_t>>(table.column(name).values);
}

inline CleaningConfig all_off() {
    return CleaningConfig{};
}

}  // namespace test_helpers
