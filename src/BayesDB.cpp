#include <iostream>
#include <string>
#include <sstream>
#include <map>

#include <sqlite3.h>

#include <BayesNet/BayesDB.h>
#include <BayesNet/Errors.h>

using std::vector;
using std::string;
using std::map;

const string VARIABLE_TABLE   = "variable";
const string EDGE_TABLE       = "edge";
const string CPT_TABLE        = "cpt";
const string CPT_PARENT_TABLE = "cpt_parent";
const string CPT_ROW_TABLE    = "cpt_row";
const string CPT_GIVEN_TABLE  = "cpt_given";
const string SAMPLE_TABLE     = "sample";

const vector<string> TABLES = {
    VARIABLE_TABLE, EDGE_TABLE, CPT_TABLE, CPT_PARENT_TABLE, CPT_ROW_TABLE, CPT_GIVEN_TABLE, SAMPLE_TABLE
};

const vector<string> SCHEMA = {
    "CREATE TABLE IF NOT EXISTS " + VARIABLE_TABLE + " (name TEXT PRIMARY KEY);",
    "CREATE TABLE IF NOT EXISTS " + EDGE_TABLE + " (parent TEXT NOT NULL, child TEXT NOT NULL, PRIMARY KEY (parent, child));",
    "CREATE TABLE IF NOT EXISTS " + CPT_TABLE + " (variable TEXT PRIMARY KEY);",
    "CREATE TABLE IF NOT EXISTS " + CPT_PARENT_TABLE + " (variable TEXT NOT NULL, position INTEGER NOT NULL, parent TEXT NOT NULL, PRIMARY KEY (variable, position));",
    "CREATE TABLE IF NOT EXISTS " + CPT_ROW_TABLE + " (serial INTEGER PRIMARY KEY, variable TEXT NOT NULL, value TEXT NOT NULL, probability REAL NOT NULL);",
    "CREATE TABLE IF NOT EXISTS " + CPT_GIVEN_TABLE + " (serial INTEGER NOT NULL, position INTEGER NOT NULL, value TEXT NOT NULL, PRIMARY KEY (serial, position));",
    "CREATE TABLE IF NOT EXISTS " + SAMPLE_TABLE + " (draw INTEGER NOT NULL, variable TEXT NOT NULL, value TEXT NOT NULL, PRIMARY KEY (draw, variable));"
};

static void _db_fail(sqlite3 *db, const string &what) {
    throw BN::StorageError("", "sqlite", what + ": " + (db ? sqlite3_errmsg(db) : "no database handle"));
}

static void _db_execute(sqlite3 *db, const string &sql) {
    char *err = nullptr;
    if (sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
        const string msg = err ? err : "unknown error";
        sqlite3_free(err);
        throw BN::StorageError("", "sqlite", "failed query: " + sql + " (" + msg + ")");
    }
}

// a prepared statement; finalized when it goes out of scope
class _Statement {
    public:
        _Statement(sqlite3 *db, const string &sql) : _db(db) {
            if (sqlite3_prepare_v2(db, sql.c_str(), -1, &_stmt, nullptr) != SQLITE_OK) {
                _db_fail(db, "failed to prepare: " + sql);
            }
        }
        ~_Statement() { sqlite3_finalize(_stmt); }

        _Statement(const _Statement &) = delete;
        _Statement & operator=(const _Statement &) = delete;

        _Statement & bind(const int pos, const string &text) {
            _check(sqlite3_bind_text(_stmt, pos, text.c_str(), -1, SQLITE_TRANSIENT));
            return *this;
        }
        _Statement & bind(const int pos, const sqlite3_int64 val) {
            _check(sqlite3_bind_int64(_stmt, pos, val));
            return *this;
        }
        _Statement & bind(const int pos, const double val) {
            _check(sqlite3_bind_double(_stmt, pos, val));
            return *this;
        }

        // @return true while there is a row to read
        bool step() {
            const int rc = sqlite3_step(_stmt);
            if (rc == SQLITE_ROW) { return true; }
            if (rc != SQLITE_DONE) { _db_fail(_db, "failed step"); }
            return false;
        }

        // for INSERT / DELETE: run to completion, then make ready for new bindings
        void run() {
            while (step()) {}
            sqlite3_reset(_stmt);
            sqlite3_clear_bindings(_stmt);
        }

        string text(const int col) const {
            const unsigned char *txt = sqlite3_column_text(_stmt, col);
            return txt ? string(reinterpret_cast<const char*>(txt)) : string();
        }
        sqlite3_int64 integer(const int col) const { return sqlite3_column_int64(_stmt, col); }
        double real(const int col) const { return sqlite3_column_double(_stmt, col); }

    private:
        sqlite3 *_db;
        sqlite3_stmt *_stmt = nullptr;

        void _check(const int rc) const { if (rc != SQLITE_OK) { _db_fail(_db, "failed bind"); } }
};

// rolls back unless committed
class _Transaction {
    public:
        _Transaction(sqlite3 *db) : _db(db) { _db_execute(_db, "BEGIN TRANSACTION;"); }
        ~_Transaction() {
            if (not _committed) { sqlite3_exec(_db, "ROLLBACK;", nullptr, nullptr, nullptr); }
        }
        void commit() { _db_execute(_db, "COMMIT;"); _committed = true; }

    private:
        sqlite3 *_db;
        bool _committed = false;
};

static sqlite3 * _db_open(const string &path) {
    sqlite3 *db = nullptr;
    if (sqlite3_open(path.c_str(), &db) != SQLITE_OK) {
        const string msg = db ? sqlite3_errmsg(db) : "out of memory";
        sqlite3_close(db);
        throw BN::StorageError("", "sqlite", "cannot open database " + path + ": " + msg);
    }
    return db;
}

namespace BN {

void BayesDB::_Close::operator()(sqlite3 *db) const { sqlite3_close(db); }

BayesDB::BayesDB(const string &path) : _db_name(path), _db(_db_open(path)) {}

BayesDB::~BayesDB() = default;

bool BayesDB::is_setup() const {
    _Statement count(_db.get(), "SELECT COUNT(*) FROM sqlite_master WHERE type == 'table' AND name = ?;");
    for (const auto &table : TABLES) {
        count.bind(1, table);
        count.step();
        const bool exists = count.integer(0) > 0;
        count.run();
        if (not exists) { return false; }
    }
    return true;
}

bool BayesDB::setup(const size_t verbose) {
    if (is_setup()) {
        if (verbose > 0) { std::cerr << "Database " << _db_name << " already set up." << std::endl; }
        return true;
    }
    _Transaction txn(_db.get());
    for (const auto &sql : SCHEMA) { _db_execute(_db.get(), sql); }
    txn.commit();
    if (verbose > 0) { std::cerr << "Set up database " << _db_name << "." << std::endl; }
    return is_setup();
}

void BayesDB::_require_setup() const {
    if (not is_setup()) { throw StorageError("", "sqlite", "database is not set up: " + _db_name); }
}

void BayesDB::save_network(const Network &structure, const CPTStore &tables, const size_t verbose) {
    _require_setup();
    sqlite3 *db = _db.get();
    _Transaction txn(db);

    for (const auto &table : { VARIABLE_TABLE, EDGE_TABLE, CPT_TABLE, CPT_PARENT_TABLE, CPT_ROW_TABLE, CPT_GIVEN_TABLE }) {
        _db_execute(db, "DELETE FROM " + table + ";");
    }

    _Statement ins_var(db, "INSERT INTO " + VARIABLE_TABLE + " (name) VALUES (?);");
    for (const auto &name : structure.variables()) { ins_var.bind(1, name).run(); }

    _Statement ins_edge(db, "INSERT INTO " + EDGE_TABLE + " (parent, child) VALUES (?, ?);");
    for (const auto &edge : structure.edges()) { ins_edge.bind(1, edge.first).bind(2, edge.second).run(); }

    _Statement ins_cpt(db, "INSERT INTO " + CPT_TABLE + " (variable) VALUES (?);");
    _Statement ins_parent(db, "INSERT INTO " + CPT_PARENT_TABLE + " (variable, position, parent) VALUES (?, ?, ?);");
    _Statement ins_row(db, "INSERT INTO " + CPT_ROW_TABLE + " (serial, variable, value, probability) VALUES (?, ?, ?, ?);");
    _Statement ins_given(db, "INSERT INTO " + CPT_GIVEN_TABLE + " (serial, position, value) VALUES (?, ?, ?);");

    sqlite3_int64 serial = 0;
    for (const auto &name : tables.variables()) {
        const CPT &table = tables.get(name);
        ins_cpt.bind(1, name).run();
        for (size_t pos = 0; pos < table.parents().size(); ++pos) {
            ins_parent.bind(1, name).bind(2, static_cast<sqlite3_int64>(pos)).bind(3, table.parents()[pos]).run();
        }
        for (const auto &entry : table.entries()) {
            ins_row.bind(1, serial).bind(2, name).bind(3, entry.first.second).bind(4, static_cast<double>(entry.second)).run();
            const auto &given = entry.first.first;
            for (size_t pos = 0; pos < given.size(); ++pos) {
                ins_given.bind(1, serial).bind(2, static_cast<sqlite3_int64>(pos)).bind(3, given[pos]).run();
            }
            ++serial;
        }
    }

    txn.commit();
    if (verbose > 0) {
        std::cerr << "Stored " << structure.size() << " variables and " << tables.size() << " CPTs in " << _db_name << "." << std::endl;
    }
}

bool BayesDB::load_network(Network &structure, CPTStore &tables) const {
    _require_setup();
    sqlite3 *db = _db.get();

    Network loaded;
    _Statement sel_var(db, "SELECT name FROM " + VARIABLE_TABLE + " ORDER BY name;");
    while (sel_var.step()) { loaded.add_variable(sel_var.text(0)); }
    if (loaded.size() == 0) { return false; }

    _Statement sel_edge(db, "SELECT parent, child FROM " + EDGE_TABLE + " ORDER BY parent, child;");
    while (sel_edge.step()) { loaded.add_edge(sel_edge.text(0), sel_edge.text(1)); }

    map<string, vector<string>> parents;
    _Statement sel_cpt(db, "SELECT variable FROM " + CPT_TABLE + ";");
    while (sel_cpt.step()) { parents[sel_cpt.text(0)]; }
    _Statement sel_parent(db, "SELECT variable, parent FROM " + CPT_PARENT_TABLE + " ORDER BY variable, position;");
    while (sel_parent.step()) { parents[sel_parent.text(0)].push_back(sel_parent.text(1)); }

    map<string, CPT> loaded_tables;
    for (const auto &vp : parents) { loaded_tables.emplace(vp.first, CPT(vp.second)); }

    map<sqlite3_int64, vector<Value>> given;
    _Statement sel_given(db, "SELECT serial, value FROM " + CPT_GIVEN_TABLE + " ORDER BY serial, position;");
    while (sel_given.step()) { given[sel_given.integer(0)].push_back(sel_given.text(1)); }

    _Statement sel_row(db, "SELECT serial, variable, value, probability FROM " + CPT_ROW_TABLE + " ORDER BY serial;");
    while (sel_row.step()) {
        const string variable = sel_row.text(1);
        auto table = loaded_tables.find(variable);
        if (table == loaded_tables.end()) {
            throw StorageError(variable, "sqlite", "stored CPT row for a variable without a stored table");
        }
        const auto g = given.find(sel_row.integer(0));
        table->second.set(sel_row.text(2), g == given.end() ? vector<Value>{} : g->second, sel_row.real(3));
    }

    CPTStore loaded_store;
    for (const auto &vt : loaded_tables) { loaded_store.set_cpt(vt.first, vt.second); }

    structure = loaded;
    tables = loaded_store;
    return true;
}

size_t BayesDB::write_samples(const vector<Assignment> &draws, const size_t verbose) {
    _require_setup();
    sqlite3 *db = _db.get();
    _Transaction txn(db);

    sqlite3_int64 next = 0;
    {
        _Statement max_draw(db, "SELECT COALESCE(MAX(draw) + 1, 0) FROM " + SAMPLE_TABLE + ";");
        if (max_draw.step()) { next = max_draw.integer(0); }
    }

    _Statement ins(db, "INSERT INTO " + SAMPLE_TABLE + " (draw, variable, value) VALUES (?, ?, ?);");
    for (const auto &draw : draws) {
        for (const auto &nv : draw) { ins.bind(1, next).bind(2, nv.first).bind(3, nv.second).run(); }
        ++next;
    }
    txn.commit();

    if (verbose > 0) {
        std::cerr << "Stored " << draws.size() << " samples in " << _db_name << " (" << next << " total)." << std::endl;
    }
    return static_cast<size_t>(next);
}

vector<Assignment> BayesDB::read_samples() const {
    _require_setup();
    vector<Assignment> draws;
    _Statement sel(_db.get(), "SELECT draw, variable, value FROM " + SAMPLE_TABLE + " ORDER BY draw;");
    sqlite3_int64 current = -1;
    while (sel.step()) {
        if (sel.integer(0) != current) {
            current = sel.integer(0);
            draws.emplace_back();
        }
        draws.back()[sel.text(1)] = sel.text(2);
    }
    return draws;
}

} // namespace BN
