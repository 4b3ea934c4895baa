#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

enum class ColumnType { MIXED, NUMERIC, DATETIME, TEXT };

// Raw scalar as handed over by a loader, before any stage commits a type.
using CellValue = std::variant<bool, int64_t, double, std::string>;
using OptionalCell = std::optional<CellValue>;

// NUMERIC -> vector<double>, TEXT -> vector<string>, DATETIME -> vector<int64_t> (Unix seconds),
// MIXED -> vector<CellValue>.
using ColumnStorage = std::variant<std::vector<double>, std::vector<std::string>, std::vector<int64_t>, std::vector<CellValue>>;
using MissingMask = std::vector<uint8_t>;

struct TypedColumn {
    std::string name;
    ColumnType type = ColumnType::MIXED;
    ColumnStorage values = std::vector<CellValue>{};
    MissingMask missing;

    size_t size() const noexcept { return missing.size(); }
    size_t missingCount() const;
    bool allMissing() const;
    // MIXED column whose observed cells are all int64/double; false when nothing is observed.
    bool holdsOnlyNumbers() const;
};

/**
 * @brief Short kind name used in dtype_changes ("mixed", "numeric", "datetime", "text").
 */
const char* columnTypeName(ColumnType type);

TypedColumn makeMixedColumn(std::string name, const std::vector<OptionalCell>& cells);
TypedColumn makeNumericColumn(std::string name, const std::vector<std::optional<double>>& cells);
TypedColumn makeTextColumn(std::string name, const std::vector<std::optional<std::string>>& cells);
TypedColumn makeDatetimeColumn(std::string name, const std::vector<std::optional<int64_t>>& unixSeconds);

class DataTable {
public:
    DataTable() = default;

    size_t rowCount() const noexcept { return rowCount_; }
    size_t colCount() const noexcept { return columns_.size(); }

    const std::vector<TypedColumn>& columns() const noexcept { return columns_; }
    std::vector<TypedColumn>& columns() noexcept { return columns_; }

    /**
     * @brief Appends a column to the table.
     * @details The first column fixes the row count of an empty table.
     * @throws Scrub::DatasetException on duplicate name, length mismatch or a storage/mask
     *         size disagreement.
     */
    void addColumn(TypedColumn column);

    /**
     * @brief Returns index of the first column with this name or -1 when absent.
     */
    int findColumnIndex(const std::string& name) const;

    /**
     * @throws Scrub::DatasetException when no column has this name.
     */
    const TypedColumn& column(const std::string& name) const;

    // Pipeline renames may produce colliding names; no uniqueness check here.
    void renameColumn(size_t index, std::string newName);

    std::vector<size_t> numericColumnIndices() const;

    /**
     * @brief Removes rows where keepMask is 0 across all columns.
     * @pre keepMask.size() == rowCount().
     * @post All typed columns keep row alignment after filtering.
     * @throws Scrub::DatasetException when mask size mismatches row count.
     */
    void removeRows(const MissingMask& keepMask);

    /**
     * @brief Removes columns where keepMask is 0. Row count is unchanged.
     * @throws Scrub::DatasetException when mask size mismatches column count.
     */
    void removeColumns(const std::vector<uint8_t>& keepMask);

    /**
     * @brief True when both rows hold equal cells in every column (missing equals missing).
     */
    bool rowsEqual(size_t a, size_t b) const;

    /**
     * @brief Text rendering of one cell, or std::nullopt for a missing cell.
     */
    std::optional<std::string> cellText(size_t col, size_t row) const;

private:
    size_t rowCount_ = 0;
    std::vector<TypedColumn> columns_;
};
