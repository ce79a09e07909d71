#include "report/ReportCli.hpp"

#include <iostream>

#include <QDateTime>

#include "common/config.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "common/models.hpp"
#include "daemon/killfeed_store.hpp"

namespace killfeed {

namespace {

QString usageText()
{
    return QStringLiteral(
        "Usage:\n"
        "  killfeed-report list [--limit N] [--offset N] [--player-only] [--format markdown|json]\n"
        "  killfeed-report search QUERY [--limit N] [--offset N] [--player-only] [--format markdown|json]\n"
        "  killfeed-report stats [--format markdown|json]\n"
        "  killfeed-report clear --yes\n"
        "Options:\n"
        "  --db PATH   database file (default from config)\n");
}

std::string formatLocalTime(std::chrono::system_clock::time_point timestamp)
{
    QDateTime dt = QDateTime::fromMSecsSinceEpoch(toEpochMillis(timestamp), Qt::UTC);
    dt = dt.toLocalTime();
    return dt.toString("yyyy-MM-dd HH:mm:ss").toStdString();
}

QString getArgValue(const QStringList &args, const QString &key)
{
    const int idx = args.indexOf(key);
    if (idx < 0 || idx + 1 >= args.size()) {
        return {};
    }
    return args.at(idx + 1);
}

QString getFormat(const QStringList &args)
{
    const QString value = getArgValue(args, QStringLiteral("--format"));
    if (value.isEmpty()) {
        return QStringLiteral("markdown");
    }
    return value.toLower();
}

bool validFormat(const QString &format)
{
    return format == QStringLiteral("markdown") || format == QStringLiteral("json");
}

// First argument after the subcommand that is neither an option nor an
// option's value.
QString positionalArgument(const QStringList &args)
{
    static const QStringList valued = {QStringLiteral("--limit"), QStringLiteral("--offset"),
                                       QStringLiteral("--format"), QStringLiteral("--db")};
    for (int i = 2; i < args.size(); ++i) {
        const QString &arg = args.at(i);
        if (valued.contains(arg)) {
            ++i;
            continue;
        }
        if (arg.startsWith(QStringLiteral("--"))) {
            continue;
        }
        return arg;
    }
    return {};
}

std::string listTitle(const EventQuery &query)
{
    if (!query.searchQuery.empty()) {
        return "# Killfeed Search: " + query.searchQuery;
    }
    return query.playerOnly ? "# Killfeed Events (player involved)" : "# Killfeed Events";
}

void renderEventsMarkdown(const EventPage &page, const EventQuery &query, const KillfeedStore &store)
{
    std::cout << listTitle(query) << "\n\n";

    if (page.events.empty()) {
        std::cout << "No events found.\n";
        return;
    }

    std::cout << "Showing " << (query.offset + 1) << "-"
              << (query.offset + static_cast<int>(page.events.size()))
              << " of " << page.total;
    if (page.hasMore) {
        std::cout << " (more available)";
    }
    std::cout << "\n\n";

    for (const auto &event : page.events) {
        const auto source = store.getEventSource(event.id);
        std::cout << "- [" << formatLocalTime(event.timestamp) << "] ("
                  << toDeathTypeString(event.deathType) << ", "
                  << toSourceString(source.value_or(EventSource::Local)) << ") "
                  << event.eventDescription;
        if (!event.location.empty() && event.location != "Unknown") {
            std::cout << " @ " << event.location;
        }
        std::cout << "\n";
        if (!event.weapon.empty()) {
            std::cout << "  - weapon: " << event.weapon << "\n";
        }
    }
}

void renderEventsJson(const EventPage &page, const EventQuery &query)
{
    nlohmann::json payload;
    payload["total"] = page.total;
    payload["offset"] = query.offset;
    payload["limit"] = query.limit;
    payload["hasMore"] = page.hasMore;
    payload["playerOnly"] = query.playerOnly;
    if (!query.searchQuery.empty()) {
        payload["query"] = query.searchQuery;
    }
    payload["events"] = page.events;

    std::cout << payload.dump(2) << std::endl;
}

} // namespace

int ReportCli::run(int argc, char *argv[])
{
    QStringList args;
    args.reserve(argc);
    for (int i = 0; i < argc; ++i) {
        args.push_back(QString::fromLocal8Bit(argv[i]));
    }

    if (args.size() < 2) {
        std::cerr << usageText().toStdString();
        return 1;
    }

    const QString command = args.at(1);
    KFLOG_INFO(QStringLiteral("ReportCli"),
               QStringLiteral("run"),
               QStringLiteral("report_cli_command"),
               QStringLiteral("user_invocation"),
               QStringLiteral("cli"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"command", command.toStdString()}}));

    const QStringList known = {QStringLiteral("list"), QStringLiteral("search"),
                               QStringLiteral("stats"), QStringLiteral("clear")};
    if (!known.contains(command)) {
        std::cerr << usageText().toStdString();
        return 1;
    }

    std::unique_ptr<KillfeedStore> store = openStore(args);
    if (!store) {
        return 2;
    }

    if (command == QStringLiteral("list")) {
        return runListReport(args, *store);
    }
    if (command == QStringLiteral("search")) {
        return runSearchReport(args, *store);
    }
    if (command == QStringLiteral("stats")) {
        return runStatsReport(args, *store);
    }
    return runClear(args, *store);
}

std::unique_ptr<KillfeedStore> ReportCli::openStore(const QStringList &args) const
{
    QString dbPath = getArgValue(args, QStringLiteral("--db"));
    PipelineConfig config;
    if (dbPath.isEmpty()) {
        config = loadPipelineConfig();
        dbPath = QString::fromStdString(config.databasePath);
    }

    try {
        return std::make_unique<KillfeedStore>(dbPath.toStdString(),
                                               config.maxStoredEvents,
                                               config.fingerprintWindowMs);
    } catch (const std::exception &ex) {
        KFLOG_ERROR(QStringLiteral("ReportCli"),
                    QStringLiteral("openStore"),
                    QStringLiteral("database_open_failed"),
                    QString::fromUtf8(ex.what()),
                    QStringLiteral("exit_nonzero"),
                    logging::defaultWho(),
                    QString(),
                    (nlohmann::json{{"path", dbPath.toStdString()}}));
        std::cerr << "Failed to open database: " << ex.what() << std::endl;
        return nullptr;
    }
}

std::optional<int> ReportCli::parseCount(const QStringList &args, const QString &key, int fallback) const
{
    const QString value = getArgValue(args, key);
    if (value.isEmpty()) {
        return fallback;
    }
    bool ok = false;
    const int parsed = value.toInt(&ok);
    if (!ok || parsed < 0) {
        return std::nullopt;
    }
    return parsed;
}

int ReportCli::runListReport(const QStringList &args, KillfeedStore &store)
{
    const QString format = getFormat(args);
    if (!validFormat(format)) {
        std::cerr << "Invalid format. Use markdown or json." << std::endl;
        return 1;
    }

    const auto limit = parseCount(args, QStringLiteral("--limit"), 20);
    const auto offset = parseCount(args, QStringLiteral("--offset"), 0);
    if (!limit || !offset) {
        std::cerr << "Invalid --limit or --offset value." << std::endl;
        return 1;
    }

    EventQuery query;
    query.limit = *limit;
    query.offset = *offset;
    query.playerOnly = args.contains(QStringLiteral("--player-only"));
    if (args.at(1) == QStringLiteral("search")) {
        query.searchQuery = positionalArgument(args).toStdString();
    }

    const EventPage page = store.query(query);

    KFLOG_INFO(QStringLiteral("ReportCli"),
               QStringLiteral("runListReport"),
               QStringLiteral("report_list"),
               QStringLiteral("user_invocation"),
               QStringLiteral("sqlite_query"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"events", page.events.size()},
                               {"total", page.total},
                               {"format", format.toStdString()}}));
    if (format == QStringLiteral("json")) {
        renderEventsJson(page, query);
    } else {
        renderEventsMarkdown(page, query, store);
    }
    return 0;
}

int ReportCli::runSearchReport(const QStringList &args, KillfeedStore &store)
{
    const QString term = positionalArgument(args);
    if (term.trimmed().isEmpty() || buildFtsMatchExpression(term.toStdString()).empty()) {
        std::cerr << "Search needs a query." << std::endl;
        std::cerr << usageText().toStdString();
        return 1;
    }
    return runListReport(args, store);
}

int ReportCli::runStatsReport(const QStringList &args, KillfeedStore &store)
{
    const QString format = getFormat(args);
    if (!validFormat(format)) {
        std::cerr << "Invalid format. Use markdown or json." << std::endl;
        return 1;
    }

    const StoreStats stats = store.stats();

    if (format == QStringLiteral("json")) {
        nlohmann::json payload;
        payload["totalEvents"] = stats.totalEvents;
        payload["playerEvents"] = stats.playerEvents;
        payload["bySource"] = stats.bySource;
        payload["oldest"] = stats.oldest ? nlohmann::json(toIso8601Utc(*stats.oldest)) : nlohmann::json();
        payload["newest"] = stats.newest ? nlohmann::json(toIso8601Utc(*stats.newest)) : nlohmann::json();
        payload["database"] = store.databasePath();
        std::cout << payload.dump(2) << std::endl;
        return 0;
    }

    std::cout << "# Killfeed Store Statistics\n\n";
    std::cout << "Database: " << store.databasePath() << "\n";
    std::cout << "Total events: " << stats.totalEvents << "\n";
    std::cout << "Player involved: " << stats.playerEvents << "\n";
    if (stats.oldest && stats.newest) {
        std::cout << "Oldest: " << toIso8601Utc(*stats.oldest) << "\n";
        std::cout << "Newest: " << toIso8601Utc(*stats.newest) << "\n";
    }
    if (!stats.bySource.empty()) {
        std::cout << "\n## By source\n\n";
        for (const auto &[source, count] : stats.bySource) {
            std::cout << "- " << source << ": " << count << "\n";
        }
    }
    return 0;
}

int ReportCli::runClear(const QStringList &args, KillfeedStore &store)
{
    if (!args.contains(QStringLiteral("--yes"))) {
        std::cerr << "Refusing to clear without --yes." << std::endl;
        return 1;
    }

    const int removed = store.stats().totalEvents;
    try {
        store.clearAllEvents();
    } catch (const std::exception &ex) {
        std::cerr << "Failed to clear events: " << ex.what() << std::endl;
        return 1;
    }

    KFLOG_INFO(QStringLiteral("ReportCli"),
               QStringLiteral("runClear"),
               QStringLiteral("report_clear"),
               QStringLiteral("user_invocation"),
               QStringLiteral("delete_all"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"removed", removed}}));
    std::cout << "Cleared " << removed << " events." << std::endl;
    return 0;
}

} // namespace killfeed
