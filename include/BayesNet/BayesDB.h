#ifndef BAYESNET_BAYESDB_H
#define BAYESNET_BAYESDB_H

#include <string>
#include <vector>
#include <memory>

#include <BayesNet/TypeDefs.h>
#include <BayesNet/Network.h>
#include <BayesNet/CPT.h>

// forward declaring the sqlite3 handle
struct sqlite3;

// Storage needs to provide:
//  - doing self setup; reporting whether that has happened
//  - writing / reading one network: structure and tables
//  - appending / reading drawn samples, one row per (draw, variable)

namespace BN {

class BayesDB {

    public:
        // opens (creating if necessary) the database at `path`
        // @throws StorageError if the database cannot be opened
        BayesDB(const std::string &path);
        ~BayesDB();

        BayesDB(const BayesDB &) = delete;
        BayesDB & operator=(const BayesDB &) = delete;

        const std::string & path() const { return _db_name; }

        // @return true if the storage container is structurally setup
        bool is_setup() const;

        // creates any missing tables; repeated invocations do not overwrite
        // @return true if storage is ready to receive / provide data
        bool setup(const size_t verbose = 0);

        // replaces the stored network (if any) with `structure` and `tables`
        void save_network(const Network &structure, const CPTStore &tables, const size_t verbose = 0);

        // @return false if no network has been stored; otherwise fills structure and tables
        bool load_network(Network &structure, CPTStore &tables) const;

        // appends draws after those already stored
        // @return the number of draws stored afterwards
        size_t write_samples(const std::vector<Assignment> &draws, const size_t verbose = 0);

        // @return every stored draw, in the order written
        std::vector<Assignment> read_samples() const;

    private:
        struct _Close { void operator()(sqlite3 *db) const; };

        const std::string _db_name;
        const std::unique_ptr<sqlite3, _Close> _db;

        void _require_setup() const;
};

} // namespace BN

#endif // BAYESNET_BAYESDB_H
