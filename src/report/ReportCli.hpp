#pragma once

#include <memory>
#include <optional>

#include <QString>
#include <QStringList>

namespace killfeed {

class KillfeedStore;

class ReportCli
{
public:
    // CLI dispatcher for listing, searching and maintaining stored events.
    // returns exit code
    int run(int argc, char *argv[]);

private:
    // Each subcommand reads the SQLite store and renders output in the chosen format.
    int runListReport(const QStringList &args, KillfeedStore &store);
    int runSearchReport(const QStringList &args, KillfeedStore &store);
    int runStatsReport(const QStringList &args, KillfeedStore &store);
    int runClear(const QStringList &args, KillfeedStore &store);

    std::unique_ptr<KillfeedStore> openStore(const QStringList &args) const;
    std::optional<int> parseCount(const QStringList &args, const QString &key, int fallback) const;
};

} // namespace killfeed
