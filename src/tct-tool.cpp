// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2013 The Bitcoin Core developers
// Copyright (c) 2016-2023 The Zcash developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php .

#include "fs.h"
#include "logging.h"
#include "util/system.h"
#include "version.h"

#include "tct/Command.hpp"
#include "tct/Storage.hpp"
#include "tct/Tree.hpp"

#include <stdexcept>
#include <stdio.h>
#include <stdlib.h>
#include <string>
#include <vector>

#include <sodium.h>

using namespace libtct;

static std::string HelpMessage()
{
    std::string strUsage;
    strUsage += "tct-tool version " + tfm::format("%d.%d.%d", CLIENT_VERSION_MAJOR, CLIENT_VERSION_MINOR, CLIENT_VERSION_REVISION) + "\n";
    strUsage += "\nUsage:\n";
    strUsage += "  tct-tool [options] insert <commitment-hex>   Insert a commitment and print its position\n";
    strUsage += "  tct-tool [options] end-block                 Seal the current block and print its root\n";
    strUsage += "  tct-tool [options] end-epoch                 Seal the current epoch and print its root\n";
    strUsage += "  tct-tool [options] root                      Print the root of the tree\n";
    strUsage += "  tct-tool [options] position                  Print the position of the next commitment\n";
    strUsage += "  tct-tool [options] witness <position|hex>    Print the authentication path of a commitment\n";
    strUsage += "  tct-tool [options] forget <position|hex>     Stop tracking a commitment\n";
    strUsage += "\nOptions:\n";
    strUsage += "  -datadir=<dir>        Specify data directory\n";
    strUsage += "  -conf=<file>          Specify configuration file (default: " + std::string(TCT_CONF_FILENAME) + ")\n";
    strUsage += "  -treekey=<key>        Key the tree is stored under (default: " + DEFAULT_TREE_KEY + ")\n";
    strUsage += tfm::format("  -dbcache=<n>          Database cache size in megabytes (%d to %d, default: %d)\n", MIN_DB_CACHE, MAX_DB_CACHE, DEFAULT_DB_CACHE);
    strUsage += "  -debug=<category>     Output debugging information (categories: tct)\n";
    strUsage += "  -printtoconsole       Send trace/debug info to console instead of debug.log file\n";
    strUsage += "  -debuglogfile=<file>  Specify location of debug log file (default: " + std::string(DEFAULT_DEBUGLOGFILE) + ")\n";
    return strUsage;
}

static int AppInitTool(int argc, char* argv[])
{
    ParseParameters(argc, argv);

    // Arguments after the options are the command.
    std::vector<std::string> args;
    for (int i = 1; i < argc; i++) {
        if (!args.empty() || argv[i][0] != '-') {
            args.push_back(argv[i]);
        }
    }

    bool fHelp = mapArgs.count("-?") || mapArgs.count("-h") || mapArgs.count("-help");
    if (fHelp || args.empty()) {
        fprintf(fHelp ? stdout : stderr, "%s", HelpMessage().c_str());
        return fHelp ? EXIT_SUCCESS : EXIT_FAILURE;
    }

    if (mapArgs.count("-datadir") && !fs::is_directory(fs::system_complete(mapArgs["-datadir"]))) {
        fprintf(stderr, "Error: Specified data directory \"%s\" does not exist.\n", mapArgs["-datadir"].c_str());
        return EXIT_FAILURE;
    }
    try {
        ReadConfigFile(GetArg("-conf", TCT_CONF_FILENAME), mapArgs, mapMultiArgs);
    } catch (const std::exception& e) {
        fprintf(stderr, "Error reading configuration file: %s\n", e.what());
        return EXIT_FAILURE;
    }
    InitLogging();

    if (sodium_init() == -1) {
        fprintf(stderr, "Error: libsodium failed to initialize\n");
        return EXIT_FAILURE;
    }

    try {
        std::string strKey = GetArg("-treekey", DEFAULT_TREE_KEY);
        TreeStore store(GetDataDir() / "tree", DbCacheBytes(GetArg("-dbcache", DEFAULT_DB_CACHE)));

        CommitmentTree tree;
        if (!store.Load(strKey, tree)) {
            LogPrintf("No commitment tree stored under '%s', starting an empty one\n", strKey);
        }
        std::string strOutput;
        if (RunCommand(tree, args, strOutput)) {
            store.Commit(strKey, tree);
        }
        fprintf(stdout, "%s", strOutput.c_str());
    } catch (const std::exception& e) {
        LogPrintf("tct-tool: %s\n", e.what());
        fprintf(stderr, "Error: %s\n", e.what());
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}

int main(int argc, char* argv[])
{
    return AppInitTool(argc, argv);
}
