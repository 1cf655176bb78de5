// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2014 The Bitcoin Core developers
// Copyright (c) 2016-2023 The Zcash developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php .

/**
 * Server/client environment: argument handling, config file parsing,
 * data directory lookup.
 */
#ifndef TCT_UTIL_SYSTEM_H
#define TCT_UTIL_SYSTEM_H

#include "fs.h"

#include <map>
#include <stdexcept>
#include <stdint.h>
#include <string>
#include <vector>

extern const char * const TCT_CONF_FILENAME;

extern std::map<std::string, std::string> mapArgs;
extern std::map<std::string, std::vector<std::string> > mapMultiArgs;
extern bool fDebug;

class missing_tct_conf : public std::runtime_error {
public:
    missing_tct_conf() : std::runtime_error("Missing tct.conf") { }
};

void ParseParameters(int argc, const char*const argv[]);

/**
 * Return string argument or default value
 *
 * @param strArg Argument to get (e.g. "-foo")
 * @param default (e.g. "1")
 * @return command-line argument or default value
 */
std::string GetArg(const std::string& strArg, const std::string& strDefault);

/**
 * Return integer argument or default value
 *
 * @param strArg Argument to get (e.g. "-foo")
 * @param default (e.g. 1)
 * @return command-line argument (0 if invalid number) or default value
 */
int64_t GetArg(const std::string& strArg, int64_t nDefault);

/**
 * Return boolean argument or default value
 *
 * @param strArg Argument to get (e.g. "-foo")
 * @param default (true or false)
 * @return command-line argument or default value
 */
bool GetBoolArg(const std::string& strArg, bool fDefault);

/**
 * Set an argument if it doesn't already have a value
 *
 * @param strArg Argument to set (e.g. "-foo")
 * @param strValue Value (e.g. "1")
 * @return true if argument gets set, false if it already had a value
 */
bool SoftSetArg(const std::string& strArg, const std::string& strValue);

/**
 * Set a boolean argument if it doesn't already have a value
 *
 * @param strArg Argument to set (e.g. "-foo")
 * @param fValue Value (e.g. false)
 * @return true if argument gets set, false if it already had a value
 */
bool SoftSetBoolArg(const std::string& strArg, bool fValue);

const fs::path GetDefaultDataDir();
const fs::path &GetDataDir();
void ClearDatadirCache();
fs::path GetConfigFile(const std::string& confPath);
/** Resolve a path relative to the data directory unless it is already absolute. */
fs::path AbsPathForConfigVal(const fs::path& path);

/**
 * Read `key=value` settings from the config file. Values already given on the
 * command line win. Throws missing_tct_conf if `fRequired` and the file is absent.
 */
void ReadConfigFile(const std::string& confPath,
                    std::map<std::string, std::string>& mapSettingsRet,
                    std::map<std::string, std::vector<std::string> >& mapMultiSettingsRet,
                    bool fRequired = false);

#endif // TCT_UTIL_SYSTEM_H
