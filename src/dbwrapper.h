// Copyright (c) 2012-2014 The Bitcoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef TCT_DBWRAPPER_H
#define TCT_DBWRAPPER_H

#include "fs.h"
#include "logging.h"
#include "serialize.h"
#include "streams.h"
#include "version.h"

#include <stdexcept>
#include <string>

#include <leveldb/db.h>
#include <leveldb/write_batch.h>

static const size_t DBWRAPPER_PREALLOC_KEY_SIZE = 64;
static const size_t DBWRAPPER_PREALLOC_VALUE_SIZE = 1024;

class dbwrapper_error : public std::runtime_error
{
public:
    dbwrapper_error(const std::string& msg) : std::runtime_error(msg) {}
};

namespace dbwrapper_private {

/** Handle database error by throwing dbwrapper_error exception.
 */
void HandleError(const leveldb::Status& status);

//! Serialized form of a typed key, e.g. `std::make_pair('t', name)`.
template <typename K>
CDataStream KeyStream(const K& key)
{
    CDataStream ssKey(SER_DISK, CLIENT_VERSION);
    ssKey.reserve(DBWRAPPER_PREALLOC_KEY_SIZE);
    ssKey << key;
    return ssKey;
}

};

/** Changes applied to a CDBWrapper all at once, or not at all. */
class CDBBatch
{
    friend class CDBWrapper;

private:
    leveldb::WriteBatch batch;

public:
    template <typename K, typename V>
    void Write(const K& key, const V& value)
    {
        CDataStream ssKey = dbwrapper_private::KeyStream(key);
        CDataStream ssValue(SER_DISK, CLIENT_VERSION);
        ssValue.reserve(DBWRAPPER_PREALLOC_VALUE_SIZE);
        ssValue << value;
        batch.Put(leveldb::Slice(ssKey.data(), ssKey.size()),
                  leveldb::Slice(ssValue.data(), ssValue.size()));
    }

    template <typename K>
    void Erase(const K& key)
    {
        CDataStream ssKey = dbwrapper_private::KeyStream(key);
        batch.Delete(leveldb::Slice(ssKey.data(), ssKey.size()));
    }
};

/**
 * A LevelDB database holding serialized keys and values. Reads report a
 * missing key as `false`; any other storage failure throws dbwrapper_error.
 */
class CDBWrapper
{
private:
    leveldb::Options options;
    leveldb::ReadOptions readoptions;
    leveldb::WriteOptions writeoptions;
    leveldb::WriteOptions syncoptions;

    leveldb::DB* pdb;

    //! Raw value stored under `key`, false if there is none.
    template <typename K>
    bool ReadRaw(const K& key, std::string& strValue) const
    {
        CDataStream ssKey = dbwrapper_private::KeyStream(key);
        leveldb::Status status = pdb->Get(readoptions, leveldb::Slice(ssKey.data(), ssKey.size()), &strValue);
        if (status.IsNotFound())
            return false;
        if (!status.ok())
            LogPrintf("LevelDB read failure: %s\n", status.ToString());
        dbwrapper_private::HandleError(status);
        return true;
    }

public:
    /**
     * @param[in] path        Location in the filesystem where leveldb data will be stored.
     * @param[in] nCacheSize  Configures various leveldb cache settings.
     * @param[in] fWipe       If true, remove all existing data.
     */
    CDBWrapper(const fs::path& path, size_t nCacheSize, bool fWipe = false);
    ~CDBWrapper();

    CDBWrapper(const CDBWrapper&) = delete;
    CDBWrapper& operator=(const CDBWrapper&) = delete;

    /** Decode the value under `key`. False if it is absent or does not decode. */
    template <typename K, typename V>
    bool Read(const K& key, V& value) const
    {
        std::string strValue;
        if (!ReadRaw(key, strValue))
            return false;
        try {
            CDataStream ssValue(strValue.data(), strValue.data() + strValue.size(), SER_DISK, CLIENT_VERSION);
            ssValue >> value;
        } catch (const std::exception& e) {
            LogPrint("tct", "LevelDB value could not be decoded: %s\n", e.what());
            return false;
        }
        return true;
    }

    template <typename K>
    bool Exists(const K& key) const
    {
        std::string strValue;
        return ReadRaw(key, strValue);
    }

    void WriteBatch(CDBBatch& batch, bool fSync = false);
};

#endif // TCT_DBWRAPPER_H
