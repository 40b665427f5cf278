#pragma once
/*
===============================================================================
RELIABILITY - MTBF and availability impact per tool type
===============================================================================

Overview
--------
A failure is one operations row with unplanned downtime > 0. Per tool type:

    failures          = count of failure rows
    downtime          = sum / mean of their unplanned downtime hours
    operating_hours   = sum over ALL operations rows of the type
    mtbf_actual       = operating_hours / failures
    mtbf_theoretical  = mean equipment mtbf_hours of the type
    mtbf_perf_pct     = mtbf_actual / mtbf_theoretical * 100
    avail_impact_pct  = downtime / operating_hours * 100

Omission Rule
-------------
Tool types with no failure rows are left out of the result. An absent type
means "no recorded failures", which is not the same as a perfect row, so no
zero-filled row is produced for it.

Ordering
--------
Worst first: descending availability impact. Ties keep the order in which
the tool types first appear in the equipment table.

Errors
------
    DataError     empty or invalid equipment / operations table
    NumericError  zero theoretical MTBF or zero operating hours for a type
                  that has failures

===============================================================================
*/

#include <algorithm>
#include <string>
#include <unordered_map>
#include <vector>

#include "errors.h"
#include "logging.h"
#include "records.h"

namespace fabcap {

struct ReliabilityRow {
    std::string toolType;
    std::size_t failureCount = 0;
    double totalDowntimeHours = 0.0;
    double meanDowntimeHours = 0.0;
    double totalOperatingHours = 0.0;
    double mtbfActualHours = 0.0;
    double mtbfTheoreticalHours = 0.0;
    double mtbfPerformancePct = 0.0;
    double availabilityImpactPct = 0.0;
};

/**
 * @class ReliabilityModel
 * @brief Failure statistics over the operations history
 *
 * Holds references to both tables; the caller keeps them alive for the
 * lifetime of the model.
 */
class ReliabilityModel {
public:
    /// @throws DataError if either table is empty or invalid
    ReliabilityModel(const EquipmentTable& equipment, const OperationsTable& operations)
        : equipment_(equipment), operations_(operations)
    {
        validateEquipment(equipment_);
        validateOperations(operations_);
    }

    ReliabilityModel(EquipmentTable&&, const OperationsTable&) = delete;
    ReliabilityModel(const EquipmentTable&, OperationsTable&&) = delete;
    ReliabilityModel(EquipmentTable&&, OperationsTable&&) = delete;

    /**
     * @brief One row per tool type with at least one failure, worst first
     */
    std::vector<ReliabilityRow> computeReliability() const {
        struct Acc {
            std::size_t failures = 0;
            double downtime = 0.0;
            double operatingHours = 0.0;
        };
        struct Rating {
            double mtbfSum = 0.0;
            std::size_t tools = 0;
        };

        // Tool types in first-appearance order.
        std::vector<std::string> order;
        std::unordered_map<std::string, Rating> ratings;
        for (const auto& e : equipment_) {
            auto [it, inserted] = ratings.try_emplace(e.toolType);
            if (inserted)
                order.push_back(e.toolType);
            it->second.mtbfSum += e.mtbfHours;
            ++it->second.tools;
        }

        std::unordered_map<std::string, Acc> history;
        for (const auto& o : operations_) {
            auto& a = history[o.toolType];
            a.operatingHours += o.operatingHours;
            if (o.unplannedDowntimeHours > 0.0) {
                ++a.failures;
                a.downtime += o.unplannedDowntimeHours;
            }
        }

        std::vector<ReliabilityRow> rows;
        for (const auto& type : order) {
            auto h = history.find(type);
            if (h == history.end() || h->second.failures == 0)
                continue;

            const auto& acc = h->second;
            const auto& rating = ratings.at(type);

            ReliabilityRow r;
            r.toolType = type;
            r.failureCount = acc.failures;
            r.totalDowntimeHours = acc.downtime;
            r.meanDowntimeHours = acc.downtime / static_cast<double>(acc.failures);
            r.totalOperatingHours = acc.operatingHours;
            r.mtbfActualHours = acc.operatingHours / static_cast<double>(acc.failures);
            r.mtbfTheoreticalHours = rating.mtbfSum / static_cast<double>(rating.tools);
            r.mtbfPerformancePct = checkedDivide(r.mtbfActualHours, r.mtbfTheoreticalHours,
                                                 "computeReliability: theoretical MTBF of " + type) * 100.0;
            r.availabilityImpactPct = checkedDivide(acc.downtime, acc.operatingHours,
                                                    "computeReliability: operating hours of " + type) * 100.0;
            rows.push_back(std::move(r));
        }

        std::stable_sort(rows.begin(), rows.end(), [](const ReliabilityRow& a, const ReliabilityRow& b) {
            return a.availabilityImpactPct > b.availabilityImpactPct;
        });

        logDebug("computeReliability: " + std::to_string(rows.size()) + " of " +
                 std::to_string(order.size()) + " tool types with recorded failures");
        return rows;
    }

private:
    const EquipmentTable& equipment_;
    const OperationsTable& operations_;
};

} // namespace fabcap
