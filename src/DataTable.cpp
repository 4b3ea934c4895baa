#include "DataTable.h"
#include "ScrubExceptions.h"
#include "ValueParsing.h"

#include <algorithm>
#include <utility>

namespace {
size_t storageSize(const ColumnStorage& values) {
    if (const auto* v = std::get_if<std::vector<double>>(&values)) return v->size();
    if (const auto* v = std::get_if<std::vector<std::string>>(&values)) return v->size();
    if (const auto* v = std::get_if<std::vector<int64_t>>(&values)) return v->size();
    return std::get<std::vector<CellValue>>(values).size();
}

template <typename T>
void filterRows(std::vector<T>& values, const MissingMask& keepMask) {
    std::vector<T> next;
    next.reserve(values.size());
    for (size_t i = 0; i < values.size(); ++i) {
        if (!keepMask[i]) continue;
        next.push_back(std::move(values[i]));
    }
    values = std::move(next);
}

CellValue cellAt(const TypedColumn& col, size_t row) {
    if (col.type == ColumnType::NUMERIC) return std::get<std::vector<double>>(col.values)[row];
    if (col.type == ColumnType::TEXT) return std::get<std::vector<std::string>>(col.values)[row];
    if (col.type == ColumnType::DATETIME) return std::get<std::vector<int64_t>>(col.values)[row];
    return std::get<std::vector<CellValue>>(col.values)[row];
}
}

size_t TypedColumn::missingCount() const {
    return static_cast<size_t>(std::count(missing.begin(), missing.end(), static_cast<uint8_t>(1)));
}

bool TypedColumn::allMissing() const {
    return std::all_of(missing.begin(), missing.end(), [](uint8_t m) { return m != 0; });
}

bool TypedColumn::holdsOnlyNumbers() const {
    if (type != ColumnType::MIXED) return false;
    const auto* cells = std::get_if<std::vector<CellValue>>(&values);
    if (!cells) return false;
    bool sawValue = false;
    for (size_t r = 0; r < cells->size(); ++r) {
        if (missing[r]) continue;
        const CellValue& cell = (*cells)[r];
        if (!std::holds_alternative<int64_t>(cell) && !std::holds_alternative<double>(cell)) return false;
        sawValue = true;
    }
    return sawValue;
}

const char* columnTypeName(ColumnType type) {
    switch (type) {
        case ColumnType::NUMERIC: return "numeric";
        case ColumnType::DATETIME: return "datetime";
        case ColumnType::TEXT: return "text";
        case ColumnType::MIXED: break;
    }
    return "mixed";
}

TypedColumn makeMixedColumn(std::string name, const std::vector<OptionalCell>& cells) {
    TypedColumn col;
    col.name = std::move(name);
    col.type = ColumnType::MIXED;
    std::vector<CellValue> values;
    values.reserve(cells.size());
    col.missing.reserve(cells.size());
    for (const auto& cell : cells) {
        values.push_back(cell ? *cell : CellValue(std::string()));
        col.missing.push_back(cell ? 0 : 1);
    }
    col.values = std::move(values);
    return col;
}

TypedColumn makeNumericColumn(std::string name, const std::vector<std::optional<double>>& cells) {
    TypedColumn col;
    col.name = std::move(name);
    col.type = ColumnType::NUMERIC;
    std::vector<double> values;
    values.reserve(cells.size());
    for (const auto& cell : cells) {
        values.push_back(cell.value_or(0.0));
        col.missing.push_back(cell ? 0 : 1);
    }
    col.values = std::move(values);
    return col;
}

TypedColumn makeTextColumn(std::string name, const std::vector<std::optional<std::string>>& cells) {
    TypedColumn col;
    col.name = std::move(name);
    col.type = ColumnType::TEXT;
    std::vector<std::string> values;
    values.reserve(cells.size());
    for (const auto& cell : cells) {
        values.push_back(cell.value_or(std::string()));
        col.missing.push_back(cell ? 0 : 1);
    }
    col.values = std::move(values);
    return col;
}

TypedColumn makeDatetimeColumn(std::string name, const std::vector<std::optional<int64_t>>& unixSeconds) {
    TypedColumn col;
    col.name = std::move(name);
    col.type = ColumnType::DATETIME;
    std::vector<int64_t> values;
    values.reserve(unixSeconds.size());
    for (const auto& cell : unixSeconds) {
        values.push_back(cell.value_or(0));
        col.missing.push_back(cell ? 0 : 1);
    }
    col.values = std::move(values);
    return col;
}

void DataTable::addColumn(TypedColumn column) {
    if (findColumnIndex(column.name) >= 0) {
        throw Scrub::DatasetException("Duplicate column name: " + column.name);
    }
    if (storageSize(column.values) != column.missing.size()) {
        throw Scrub::DatasetException("Column '" + column.name + "' storage and missing mask disagree in length");
    }
    if (columns_.empty()) {
        rowCount_ = column.missing.size();
    } else if (column.missing.size() != rowCount_) {
        throw Scrub::DatasetException("Column '" + column.name + "' has " + std::to_string(column.missing.size()) +
                                      " rows, table has " + std::to_string(rowCount_));
    }
    columns_.push_back(std::move(column));
}

int DataTable::findColumnIndex(const std::string& name) const {
    for (size_t i = 0; i < columns_.size(); ++i) {
        if (columns_[i].name == name) return static_cast<int>(i);
    }
    return -1;
}

const TypedColumn& DataTable::column(const std::string& name) const {
    const int idx = findColumnIndex(name);
    if (idx < 0) throw Scrub::DatasetException("Unknown column: " + name);
    return columns_[static_cast<size_t>(idx)];
}

void DataTable::renameColumn(size_t index, std::string newName) {
    if (index >= columns_.size()) throw Scrub::DatasetException("Column index out of range");
    columns_[index].name = std::move(newName);
}

std::vector<size_t> DataTable::numericColumnIndices() const {
    std::vector<size_t> out;
    for (size_t i = 0; i < columns_.size(); ++i) {
        if (columns_[i].type == ColumnType::NUMERIC) out.push_back(i);
    }
    return out;
}

void DataTable::removeRows(const MissingMask& keepMask) {
    if (keepMask.size() != rowCount_) throw Scrub::DatasetException("Row mask size mismatch");

    for (auto& col : columns_) {
        if (col.type == ColumnType::NUMERIC) {
            filterRows(std::get<std::vector<double>>(col.values), keepMask);
        } else if (col.type == ColumnType::TEXT) {
            filterRows(std::get<std::vector<std::string>>(col.values), keepMask);
        } else if (col.type == ColumnType::DATETIME) {
            filterRows(std::get<std::vector<int64_t>>(col.values), keepMask);
        } else {
            filterRows(std::get<std::vector<CellValue>>(col.values), keepMask);
        }
        filterRows(col.missing, keepMask);
    }

    rowCount_ = static_cast<size_t>(std::count_if(keepMask.begin(), keepMask.end(), [](uint8_t k) { return k != 0; }));
}

void DataTable::removeColumns(const std::vector<uint8_t>& keepMask) {
    if (keepMask.size() != columns_.size()) throw Scrub::DatasetException("Column mask size mismatch");

    std::vector<TypedColumn> next;
    next.reserve(columns_.size());
    for (size_t c = 0; c < columns_.size(); ++c) {
        if (keepMask[c]) next.push_back(std::move(columns_[c]));
    }
    columns_ = std::move(next);
}

bool DataTable::rowsEqual(size_t a, size_t b) const {
    for (const auto& col : columns_) {
        const bool missA = col.missing[a] != 0;
        const bool missB = col.missing[b] != 0;
        if (missA || missB) {
            if (missA != missB) return false;
            continue;
        }
        switch (col.type) {
            case ColumnType::NUMERIC: {
                const auto& v = std::get<std::vector<double>>(col.values);
                if (!(v[a] == v[b])) return false;
                break;
            }
            case ColumnType::TEXT: {
                const auto& v = std::get<std::vector<std::string>>(col.values);
                if (v[a] != v[b]) return false;
                break;
            }
            case ColumnType::DATETIME: {
                const auto& v = std::get<std::vector<int64_t>>(col.values);
                if (v[a] != v[b]) return false;
                break;
            }
            case ColumnType::MIXED: {
                const auto& v = std::get<std::vector<CellValue>>(col.values);
                if (!ValueParsing::cellsEqual(v[a], v[b])) return false;
                break;
            }
        }
    }
    return true;
}

std::optional<std::string> DataTable::cellText(size_t col, size_t row) const {
    if (col >= columns_.size() || row >= rowCount_) throw Scrub::DatasetException("Cell index out of range");
    const TypedColumn& c = columns_[col];
    if (c.missing[row]) return std::nullopt;
    if (c.type == ColumnType::DATETIME) {
        return ValueParsing::formatTimestamp(std::get<std::vector<int64_t>>(c.values)[row]);
    }
    return ValueParsing::cellToText(cellAt(c, row));
}
