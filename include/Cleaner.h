#pragma once
#include "CleaningConfig.h"
#include "CleaningReport.h"
#include "DataTable.h"

class Cleaner {
public:
    /**
     * @brief Runs every cleaning stage in order over the table.
     * @pre table was built through DataTable::addColumn (aligned, uniquely named columns).
     * @post table holds the cleaned data; no MIXED column remains.
     * @throws Scrub::ConfigurationException when config fails validation. Stage failures never
     *         propagate; they are recorded as FAILED outcomes in the report.
     */
    static CleaningReport run(DataTable& table, const CleaningConfig& config);
};
