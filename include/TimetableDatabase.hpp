#pragma once
#include <string>
#include <vector>
#include <mutex>
#include "sqlite3.h"
#include "Types.hpp"

// SQLite file holding the timetable snapshot written by the daily fetch.
class TimetableDatabase
{
private:
    sqlite3* db;
    std::mutex mutex;

    static std::string columnText(sqlite3_stmt* stmt, int column);

public:
    TimetableDatabase(std::string const& path);
    ~TimetableDatabase();

    TimetableDatabase(TimetableDatabase const&) = delete;
    TimetableDatabase& operator=(TimetableDatabase const&) = delete;

    int importCsv(std::string const& csvPath);
    std::vector<ServiceRecord> readDay(std::string const& ssd, std::string const& zone);
    void pruneBefore(std::string const& ssd);
};
