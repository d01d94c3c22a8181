#include <fstream>
#include <sstream>
#include <iostream>
#include <stdexcept>
#include "TimetableDatabase.hpp"
#include "CallResolver.hpp"
#include "Errors.hpp"

namespace
{
    constexpr std::size_t kCsvColumns = 12;
}

TimetableDatabase::TimetableDatabase(std::string const& path)
    : db(nullptr)
{
    int rc = sqlite3_open(path.c_str(), &db);
    if (rc != SQLITE_OK)
    {
        std::string message = db ? sqlite3_errmsg(db) : "out of memory";
        if (db) sqlite3_close(db);
        db = nullptr;
        throw std::runtime_error("Failed to open timetable DB " + path + ": " + message);
    }

    const char* createSql =
        "CREATE TABLE IF NOT EXISTS ScheduleCalls ("
        "  rid TEXT NOT NULL, "
        "  uid TEXT, "
        "  train_id TEXT, "
        "  ssd TEXT NOT NULL, "
        "  toc TEXT, "
        "  seq INTEGER NOT NULL, "
        "  tpl TEXT NOT NULL, "
        "  pta TEXT, "
        "  ptd TEXT, "
        "  wta TEXT, "
        "  wtd TEXT, "
        "  wtp TEXT, "
        "  PRIMARY KEY (rid, seq)"
        ");"
        "CREATE INDEX IF NOT EXISTS ScheduleCallsBySsd ON ScheduleCalls (ssd);";

    char* errMsg = nullptr;
    rc = sqlite3_exec(db, createSql, nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK)
    {
        std::string message = errMsg ? errMsg : "unknown error";
        if (errMsg) sqlite3_free(errMsg);
        sqlite3_close(db);
        db = nullptr;
        throw std::runtime_error("Failed to create timetable tables: " + message);
    }
}

TimetableDatabase::~TimetableDatabase()
{
    if (db) sqlite3_close(db);
}

std::string TimetableDatabase::columnText(sqlite3_stmt* stmt, int column)
{
    const unsigned char* text = sqlite3_column_text(stmt, column);
    return text ? reinterpret_cast<const char*>(text) : "";
}

int TimetableDatabase::importCsv(std::string const& csvPath)
{
    std::lock_guard<std::mutex> lock(mutex);

    std::ifstream file(csvPath);
    if (!file.is_open())
        throw TimetableUnavailable("Could not open timetable CSV " + csvPath);

    std::cout << "[Timetable] Importing " << csvPath << "..." << std::endl;

    sqlite3_stmt* deleteStmt = nullptr;
    sqlite3_stmt* insertStmt = nullptr;
    if (sqlite3_prepare_v2(db, "DELETE FROM ScheduleCalls WHERE rid = ?", -1, &deleteStmt, nullptr) != SQLITE_OK ||
        sqlite3_prepare_v2(db,
            "INSERT OR REPLACE INTO ScheduleCalls "
            "(rid, uid, train_id, ssd, toc, seq, tpl, pta, ptd, wta, wtd, wtp) "
            "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)", -1, &insertStmt, nullptr) != SQLITE_OK)
    {
        std::string message = sqlite3_errmsg(db);
        sqlite3_finalize(deleteStmt);
        sqlite3_finalize(insertStmt);
        throw TimetableUnavailable("Failed to prepare timetable import: " + message);
    }

    sqlite3_exec(db, "BEGIN TRANSACTION;", nullptr, nullptr, nullptr);

    std::string line;
    std::getline(file, line);

    int count = 0;
    int skipped = 0;
    std::string previousRid;
    while (std::getline(file, line))
    {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) continue;

        std::stringstream ss(line);
        std::string segment;
        std::vector<std::string> row;
        while (std::getline(ss, segment, ','))
            row.push_back(segment);
        if (row.size() < 7)
        {
            ++skipped;
            continue;
        }
        row.resize(kCsvColumns);

        int seq = 0;
        try
        {
            seq = std::stoi(row[5]);
        }
        catch (std::exception const&)
        {
            ++skipped;
            continue;
        }
        if (row[0].empty() || row[3].empty() || row[6].empty())
        {
            ++skipped;
            continue;
        }

        if (row[0] != previousRid)
        {
            sqlite3_bind_text(deleteStmt, 1, row[0].c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_step(deleteStmt);
            sqlite3_reset(deleteStmt);
            previousRid = row[0];
        }

        for (std::size_t i = 0; i < kCsvColumns; ++i)
        {
            int param = static_cast<int>(i) + 1;
            if (i == 5)
                sqlite3_bind_int(insertStmt, param, seq);
            else if (row[i].empty())
                sqlite3_bind_null(insertStmt, param);
            else
                sqlite3_bind_text(insertStmt, param, row[i].c_str(), -1, SQLITE_TRANSIENT);
        }

        int rc = sqlite3_step(insertStmt);
        sqlite3_reset(insertStmt);
        if (rc != SQLITE_DONE)
        {
            std::cerr << "[Timetable] Insert failed: " << sqlite3_errmsg(db) << "\n";
            ++skipped;
            continue;
        }
        count++;
    }

    sqlite3_exec(db, "COMMIT;", nullptr, nullptr, nullptr);
    sqlite3_finalize(deleteStmt);
    sqlite3_finalize(insertStmt);

    std::cout << "[Timetable] Import complete. Loaded " << count << " calls";
    if (skipped > 0)
        std::cout << " (" << skipped << " malformed rows skipped)";
    std::cout << "." << std::endl;

    return count;
}

std::vector<ServiceRecord> TimetableDatabase::readDay(std::string const& ssd, std::string const& zone)
{
    std::lock_guard<std::mutex> lock(mutex);

    const char* sql =
        "SELECT rid, uid, train_id, toc, tpl, pta, ptd, wta, wtd, wtp "
        "FROM ScheduleCalls WHERE ssd = ? ORDER BY rid, seq;";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK)
        throw TimetableUnavailable(std::string("Failed to query timetable: ") + sqlite3_errmsg(db));

    sqlite3_bind_text(stmt, 1, ssd.c_str(), -1, SQLITE_TRANSIENT);

    std::vector<ServiceRecord> records;
    CallResolver resolver(ssd, zone);
    int rc = SQLITE_OK;

    try
    {
        while ((rc = sqlite3_step(stmt)) == SQLITE_ROW)
        {
            std::string rid = columnText(stmt, 0);
            if (records.empty() || records.back().serviceId != rid)
            {
                ServiceRecord record;
                record.serviceId = rid;
                record.uid       = columnText(stmt, 1);
                record.headcode  = columnText(stmt, 2);
                record.toc       = columnText(stmt, 3);
                record.ssd       = ssd;
                records.push_back(std::move(record));
                resolver = CallResolver(ssd, zone);
            }

            CallResolver::RawCall raw;
            raw.location = columnText(stmt, 4);
            raw.pta      = columnText(stmt, 5);
            raw.ptd      = columnText(stmt, 6);
            raw.wta      = columnText(stmt, 7);
            raw.wtd      = columnText(stmt, 8);
            raw.wtp      = columnText(stmt, 9);

            auto call = resolver.resolve(raw);
            if (!call)
                continue;

            records.back().calls.push_back(std::move(*call));
        }
    }
    catch (std::exception const& e)
    {
        sqlite3_finalize(stmt);
        throw TimetableUnavailable(std::string("Failed to parse timetable: ") + e.what());
    }

    if (rc != SQLITE_DONE)
    {
        std::string message = sqlite3_errmsg(db);
        sqlite3_finalize(stmt);
        throw TimetableUnavailable("Error reading timetable: " + message);
    }
    sqlite3_finalize(stmt);

    if (records.empty())
        throw TimetableUnavailable("No timetable rows for " + ssd);

    return records;
}

void TimetableDatabase::pruneBefore(std::string const& ssd)
{
    std::lock_guard<std::mutex> lock(mutex);

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, "DELETE FROM ScheduleCalls WHERE ssd < ?;", -1, &stmt, nullptr) != SQLITE_OK)
    {
        std::cerr << "[Timetable] Failed to prepare prune: " << sqlite3_errmsg(db) << "\n";
        return;
    }

    sqlite3_bind_text(stmt, 1, ssd.c_str(), -1, SQLITE_TRANSIENT);
    if (sqlite3_step(stmt) != SQLITE_DONE)
        std::cerr << "[Timetable] Prune failed: " << sqlite3_errmsg(db) << "\n";
    else
        std::cout << "[Timetable] Pruned " << sqlite3_changes(db) << " calls before " << ssd << "\n";

    sqlite3_finalize(stmt);
}
