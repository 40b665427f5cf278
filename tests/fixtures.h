#pragma once
/*
===============================================================================
TEST FIXTURES - Small in-memory fab shared by the test suites
===============================================================================

Fleet
-----
    tool      type             wph  util  mtbf  status
    EUV-01    Lithography_EUV  100  0.80   500  Active     (critical)
    EUV-02    Lithography_EUV  100  0.80   500  Active     (critical)
    ETCH-01   Etch_Plasma      200  0.90   400  Active
    ETCH-02   Etch_Plasma      200  0.90   400  Active
    ETCH-03   Etch_Plasma      200  0.90   400  Upgrade
    CMP-01    CMP              150  0.75   600  Maintenance

Effective weekly capacity (168 h):
    Lithography_EUV   200 * 168 * 0.80 = 26880
    Etch_Plasma       600 * 168 * 0.90 = 90720
    CMP               150 * 168 * 0.75 = 18900

Max supportable output (steps EUV 25, Etch 65, CMP 25; normalization 10):
    CMP 7560 < EUV 10752 < Etch ~13957  -> CMP is the binding constraint

Operations
----------
Two days (2025-01-01, 2025-01-02), one row per tool, 20 operating hours each.
Day 1 output 800 per tool, day 2 output 1000 per tool -> weekly 6000 * 7.
Unplanned downtime: ETCH-01 2h (day 1), ETCH-02 4h (day 2), EUV-01 1h (day 2).
CMP has none.

Forecast
--------
Q1 2025: 400000 + 250000; Q2 2025: 300000 + 207000 -> 507000 / 13 = 39000 wpw.

CapEx
-----
    id   investment  npv  irr  risk    status
    P1   400M        200M 18   Low     In Progress
    P2   300M        120M 15   Medium  Approved
    P3   200M        150M 25   High    Planning
    P4   500M        100M 10   Medium  In Progress

===============================================================================
*/

#include <chrono>
#include <string>
#include <vector>

#include <fabcap/config.h>
#include <fabcap/logging.h>
#include <fabcap/records.h>

namespace fabcap::test {

inline constexpr double kMillion = 1.0e6;

inline Date ymd(int y, unsigned m, unsigned d) {
    return std::chrono::year{y} / std::chrono::month{m} / std::chrono::day{d};
}

inline EquipmentTable fleetEquipment() {
    return {
        {"EUV-01", "Lithography_EUV", 100.0, 0.80, 500.0, ToolStatus::Active, true},
        {"EUV-02", "Lithography_EUV", 100.0, 0.80, 500.0, ToolStatus::Active, true},
        {"ETCH-01", "Etch_Plasma", 200.0, 0.90, 400.0, ToolStatus::Active, false},
        {"ETCH-02", "Etch_Plasma", 200.0, 0.90, 400.0, ToolStatus::Active, false},
        {"ETCH-03", "Etch_Plasma", 200.0, 0.90, 400.0, ToolStatus::Upgrade, false},
        {"CMP-01", "CMP", 150.0, 0.75, 600.0, ToolStatus::Maintenance, false},
    };
}

inline OperationRecord opRow(Date date, const std::string& toolId, const std::string& toolType,
                             double output, double downtime, double utilization = 0.85) {
    OperationRecord o;
    o.date = date;
    o.toolId = toolId;
    o.toolType = toolType;
    o.utilizationRate = utilization;
    o.availability = 0.90;
    o.performanceEfficiency = 0.95;
    o.qualityRate = 0.98;
    o.oee = computeOee(o.availability, o.performanceEfficiency, o.qualityRate);
    o.outputWafers = output;
    o.operatingHours = 20.0;
    o.unplannedDowntimeHours = downtime;
    return o;
}

inline OperationsTable fleetOperations() {
    const Date d1 = ymd(2025, 1, 1);
    const Date d2 = ymd(2025, 1, 2);
    return {
        opRow(d1, "EUV-01", "Lithography_EUV", 800.0, 0.0, 0.80),
        opRow(d1, "EUV-02", "Lithography_EUV", 800.0, 0.0, 0.80),
        opRow(d1, "ETCH-01", "Etch_Plasma", 800.0, 2.0, 0.80),
        opRow(d1, "ETCH-02", "Etch_Plasma", 800.0, 0.0, 0.80),
        opRow(d1, "ETCH-03", "Etch_Plasma", 800.0, 0.0, 0.80),
        opRow(d1, "CMP-01", "CMP", 800.0, 0.0, 0.80),
        opRow(d2, "EUV-01", "Lithography_EUV", 1000.0, 1.0),
        opRow(d2, "EUV-02", "Lithography_EUV", 1000.0, 0.0),
        opRow(d2, "ETCH-01", "Etch_Plasma", 1000.0, 0.0),
        opRow(d2, "ETCH-02", "Etch_Plasma", 1000.0, 4.0),
        opRow(d2, "ETCH-03", "Etch_Plasma", 1000.0, 0.0),
        opRow(d2, "CMP-01", "CMP", 1000.0, 0.0),
    };
}

inline ForecastTable fleetForecast() {
    return {
        {ymd(2025, 1, 1), "Logic_N3", 400000.0},
        {ymd(2025, 1, 1), "Memory_HBM", 250000.0},
        {ymd(2025, 4, 1), "Logic_N3", 300000.0},
        {ymd(2025, 4, 1), "Memory_HBM", 207000.0},
    };
}

inline CapExTable fleetProjects() {
    return {
        {"P1", "EUV expansion", 400 * kMillion, 200 * kMillion, 18.0, RiskLevel::Low, "In Progress"},
        {"P2", "Etch chamber upgrade", 300 * kMillion, 120 * kMillion, 15.0, RiskLevel::Medium, "Approved"},
        {"P3", "CMP line", 200 * kMillion, 150 * kMillion, 25.0, RiskLevel::High, "Planning"},
        {"P4", "Metrology refresh", 500 * kMillion, 100 * kMillion, 10.0, RiskLevel::Medium, "In Progress"},
    };
}

/**
 * @brief Captures log lines for the lifetime of the object
 *
 * Restores the default sink and the previous level on destruction.
 */
class LogCapture {
public:
    explicit LogCapture(LogLevel level = LogLevel::Debug)
        : previous_(logLevel())
    {
        setLogLevel(level);
        setLogSink([this](LogLevel lvl, const std::string& msg) {
            lines.push_back({lvl, msg});
        });
    }

    ~LogCapture() {
        resetLogSink();
        setLogLevel(previous_);
    }

    LogCapture(const LogCapture&) = delete;
    LogCapture& operator=(const LogCapture&) = delete;

    struct Line {
        LogLevel level;
        std::string message;
    };

    std::vector<Line> lines;

    bool contains(LogLevel level, const std::string& fragment) const {
        for (const auto& l : lines) {
            if (l.level == level && l.message.find(fragment) != std::string::npos)
                return true;
        }
        return false;
    }

private:
    LogLevel previous_;
};

} // namespace fabcap::test
