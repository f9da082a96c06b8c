// Configure-time probe: exits 0 when the linked SQLite can create an FTS5 table
#include <sqlite3.h>

int main() {
    sqlite3* db = nullptr;
    if (sqlite3_open(":memory:", &db) != SQLITE_OK)
        return 1;
    int rc = sqlite3_exec(db, "CREATE VIRTUAL TABLE probe USING fts5(body)", nullptr, nullptr,
                          nullptr);
    sqlite3_close(db);
    return rc == SQLITE_OK ? 0 : 1;
}
