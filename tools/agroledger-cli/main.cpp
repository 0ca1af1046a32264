#include <agroledger/app/app_context.h>
#include <agroledger/config/config_helpers.h>
#include <agroledger/lookup/tax_id.h>
#include <agroledger/store/ordinal_date.h>

#include <spdlog/fmt/fmt.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <CLI/CLI.hpp>

#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <vector>

using namespace agroledger;

namespace {

std::atomic<bool> g_stop{false};

void on_signal(int) {
    g_stop.store(true);
}

void setup_logging(const std::string& logFile, const std::string& level) {
    try {
        if (!logFile.empty()) {
            std::filesystem::path p(logFile);
            if (p.has_parent_path())
                std::filesystem::create_directories(p.parent_path());
            const size_t max_size = 10 * 1024 * 1024; // 10MB per file
            const size_t max_files = 5;
            auto rotating_sink =
                std::make_shared<spdlog::sinks::rotating_file_sink_mt>(logFile, max_size, max_files);
            auto logger = std::make_shared<spdlog::logger>("agroledger", rotating_sink);
            spdlog::set_default_logger(logger);
            spdlog::flush_on(spdlog::level::info);
        } else {
            spdlog::set_default_logger(spdlog::stderr_color_mt("agroledger"));
        }
    } catch (const spdlog::spdlog_ex& e) {
        std::cerr << "Log setup failed, using default logger: " << e.what() << "\n";
    } catch (const std::filesystem::filesystem_error& e) {
        std::cerr << "Log setup failed, using default logger: " << e.what() << "\n";
    }

    if (level == "trace") {
        spdlog::set_level(spdlog::level::trace);
    } else if (level == "debug") {
        spdlog::set_level(spdlog::level::debug);
    } else if (level == "info") {
        spdlog::set_level(spdlog::level::info);
    } else if (level == "warn") {
        spdlog::set_level(spdlog::level::warn);
    } else if (level == "error") {
        spdlog::set_level(spdlog::level::err);
    }
}

int fail(const Error& error) {
    std::cerr << "Error: " << error.message << " (" << errorToString(error.code) << ")\n";
    return 1;
}

Result<store::OrdinalRange> parseRange(const std::string& from, const std::string& to) {
    store::OrdinalRange range;
    if (!from.empty()) {
        auto d = store::parseLedgerDate(from);
        if (!d)
            return Error{ErrorCode::ValidationError, "Bad --from date: " + from};
        range.from = store::toOrdinal(*d);
    }
    if (!to.empty()) {
        auto d = store::parseLedgerDate(to);
        if (!d)
            return Error{ErrorCode::ValidationError, "Bad --to date: " + to};
        range.to = store::toOrdinal(*d);
    }
    return range;
}

std::string displayDate(const std::string& iso) {
    auto d = store::parseLedgerDate(iso);
    return d ? store::toDisplayString(*d) : iso;
}

void printRow(const sync::LedgerRow& r) {
    std::cout << fmt::format("{:>6}  {:10}  {:20.20}  {:12.12}  {:24.24}  {:9}  {:>12.2f}  {:>12.2f}  "
                             "{:>14.2f}  {}\n",
                             r.id, r.date, r.propertyName, r.documentNumber, r.counterpartyName,
                             r.kindLabel, r.credit, r.debit, r.signedBalance, r.author);
}

struct RangeArgs {
    std::string from;
    std::string to;
};

void addRangeOptions(CLI::App* cmd, RangeArgs& args) {
    cmd->add_option("--from", args.from, "First date (DD/MM/YYYY or YYYY-MM-DD)");
    cmd->add_option("--to", args.to, "Last date (DD/MM/YYYY or YYYY-MM-DD)");
}

} // namespace

int main(int argc, char* argv[]) {
    CLI::App app{"agroledger - rural producer ledger"};
    app.require_subcommand(1);

    std::string configPath;
    std::string logFile;
    std::string logLevel;
    std::string dataDir;
    std::string profile;
    app.add_option("--config", configPath, "Configuration file path");
    app.add_option("--data-dir", dataDir, "Data directory");
    app.add_option("--profile", profile, "Profile name");
    app.add_option("--log-file", logFile, "Log file path (rotating)");
    app.add_option("--log-level", logLevel, "Log level (trace/debug/info/warn/error)");

    auto* migrate = app.add_subcommand("migrate", "Create or upgrade the local store");

    store::LedgerEntry addEntry;
    int addKind = 1;
    std::string addCategory;
    std::string addCounterpartyTaxId;
    bool addAllowDuplicate = false;
    auto* add = app.add_subcommand("add", "Post an entry with its running balance");
    add->add_option("--id", addEntry.id, "Existing entry to edit");
    add->add_option("--date", addEntry.date, "DD/MM/YYYY or YYYY-MM-DD")->required();
    add->add_option("--property", addEntry.propertyId, "Property id")->required();
    add->add_option("--account", addEntry.accountId, "Account id")->required();
    add->add_option("--doc", addEntry.documentNumber, "Document number");
    add->add_option("--doc-type", addEntry.documentType, "Document type");
    add->add_option("--description", addEntry.description, "Description");
    add->add_option("--counterparty", addCounterpartyTaxId, "Counterparty CPF/CNPJ");
    add->add_option("--kind", addKind, "1 revenue, 2 expense, 3 advance");
    add->add_option("--credit", addEntry.credit, "Amount in");
    add->add_option("--debit", addEntry.debit, "Amount out");
    add->add_option("--category", addCategory, "Category");
    add->add_option("--author", addEntry.author, "User recording the entry");
    add->add_flag("--allow-duplicate", addAllowDuplicate, "Skip the duplicate document check");

    RangeArgs listRange;
    bool listRemote = false;
    std::vector<int64_t> listProperties;
    auto* list = app.add_subcommand("list", "List ledger entries, newest first");
    addRangeOptions(list, listRange);
    list->add_flag("--remote", listRemote, "Read from the remote backend");
    list->add_option("--property", listProperties, "Restrict to property ids");

    auto* balances = app.add_subcommand("balances", "Signed balance per account");

    RangeArgs summaryRange;
    auto* summary = app.add_subcommand("summary", "Totals per category and month");
    addRangeOptions(summary, summaryRange);

    auto* archive = app.add_subcommand("archive", "Compressed daily copy of the store");

    std::string restoreSource;
    std::string restoreTarget;
    auto* restore = app.add_subcommand("restore", "Decompress an archive");
    restore->add_option("archive", restoreSource, "Archive file")->required();
    restore->add_option("target", restoreTarget, "Output database file")->required();

    RangeArgs pullRange;
    auto* pull = app.add_subcommand("pull", "Copy remote entries into the local store");
    addRangeOptions(pull, pullRange);

    RangeArgs pushRange;
    auto* push = app.add_subcommand("push", "Upsert local entries to the remote backend");
    addRangeOptions(push, pushRange);

    int watchSeconds = 0;
    auto* watch = app.add_subcommand("watch", "Apply remote changes until interrupted");
    watch->add_option("--seconds", watchSeconds, "Stop after this many seconds (0 = until Ctrl-C)");

    std::string lookupId;
    auto* lookupCmd = app.add_subcommand("lookup", "Taxpayer registry lookup (CPF/CNPJ)");
    lookupCmd->add_option("tax_id", lookupId, "CPF or CNPJ")->required();

    std::string userName;
    std::string userPassword;
    auto* users = app.add_subcommand("users", "Local application users");
    users->require_subcommand(1);
    auto* usersAdd = users->add_subcommand("add", "Add a user");
    usersAdd->add_option("username", userName)->required();
    usersAdd->add_option("--password", userPassword)->required();
    auto* usersVerify = users->add_subcommand("verify", "Check a password");
    usersVerify->add_option("username", userName)->required();
    usersVerify->add_option("--password", userPassword)->required();
    auto* usersRemove = users->add_subcommand("remove", "Remove a user");
    usersRemove->add_option("username", userName)->required();
    auto* usersList = users->add_subcommand("list", "List users");

    std::string adminCurrent;
    std::string adminNext;
    auto* adminPasswd = app.add_subcommand("admin-passwd", "Change the administrator password");
    adminPasswd->add_option("--current", adminCurrent)->required();
    adminPasswd->add_option("--new", adminNext)->required();

    std::string loginName;
    std::string loginPassword;
    bool loginAdmin = false;
    auto* login = app.add_subcommand("login", "Check credentials against the remote backend");
    login->add_option("username", loginName, "Username, or e-mail with --admin")->required();
    login->add_option("--password", loginPassword)->required();
    login->add_flag("--admin", loginAdmin, "Administrator sign-in");

    CLI11_PARSE(app, argc, argv);

    // Config file, then environment, then flags
    auto cfg = config::AppConfig::load(config::get_config_path(configPath));
    if (!dataDir.empty())
        cfg.dataDir = config::expand_tilde(dataDir);
    if (!profile.empty())
        cfg.profile = profile;
    if (!logLevel.empty())
        cfg.logLevel = logLevel;
    setup_logging(logFile, cfg.logLevel);

    const bool needsRemote = (list->parsed() && listRemote) || pull->parsed() || push->parsed() ||
                             watch->parsed() || login->parsed();

    app::AppContext::Options options;
    options.config = cfg;
    if (needsRemote) {
        auto remote = sync::RemoteConfig::fromEnvironment();
        if (!remote) {
            spdlog::critical("Remote configuration invalid: {}", remote.error().message);
            return fail(remote.error());
        }
        options.remote = remote.value();
    }

    if (restore->parsed()) {
        auto r = app::DailyArchiver::decompressFile(restoreSource, restoreTarget);
        if (!r)
            return fail(r.error());
        std::cout << "Restored " << restoreSource << " to " << restoreTarget << "\n";
        return 0;
    }

    auto created = app::AppContext::create(std::move(options));
    if (!created) {
        spdlog::critical("Cannot open store: {}", created.error().message);
        return fail(created.error());
    }
    auto& ctx = *created.value();
    auto& store = ctx.store();

    if (migrate->parsed()) {
        std::cout << "Store ready at " << store.path() << "\n";
        return 0;
    }

    if (add->parsed()) {
        auto kind = store::entryKindFromCode(addKind);
        if (!kind)
            return fail(Error{ErrorCode::ValidationError, "Bad --kind: " + std::to_string(addKind)});
        addEntry.kind = *kind;
        if (!addCategory.empty())
            addEntry.category = addCategory;

        if (!addCounterpartyTaxId.empty()) {
            auto taxKind = lookup::detectTaxIdKind(addCounterpartyTaxId);
            if (!taxKind || !lookup::isValidTaxId(addCounterpartyTaxId, *taxKind))
                return fail(Error{ErrorCode::ValidationError,
                                  "Invalid CPF/CNPJ: " + addCounterpartyTaxId});
            auto found = store.findCounterpartyByTaxId(store::digitsOnly(addCounterpartyTaxId));
            if (!found)
                return fail(found.error());
            if (!found.value())
                return fail(Error{ErrorCode::NotFound,
                                  "Unknown counterparty " + lookup::formatTaxId(addCounterpartyTaxId)});
            addEntry.counterpartyId = found.value()->id;
        }

        if (addEntry.counterpartyId && !addEntry.documentNumber.empty() && !addAllowDuplicate) {
            std::optional<EntryId> exclude;
            if (addEntry.id > 0)
                exclude = addEntry.id;
            auto dup = store.findDuplicateDocument(addEntry.documentNumber, *addEntry.counterpartyId,
                                                   exclude);
            if (!dup)
                return fail(dup.error());
            if (dup.value()) {
                std::cerr << "Document " << addEntry.documentNumber
                          << " already recorded for this counterparty as entry " << *dup.value()
                          << "\n";
                return 5;
            }
        }

        auto id = store.postEntry(addEntry);
        if (!id)
            return fail(id.error());
        auto posted = store.getEntry(id.value());
        if (!posted)
            return fail(posted.error());
        if (posted.value())
            std::cout << fmt::format("entry {}  balance {:.2f}\n", id.value(),
                                     posted.value()->signedClosingBalance());
        return 0;
    }

    if (list->parsed()) {
        auto range = parseRange(listRange.from, listRange.to);
        if (!range)
            return fail(range.error());

        if (listRemote) {
            auto ledger = ctx.remoteLedger();
            if (!ledger)
                return fail(ledger.error());
            auto rows = ledger.value()->listEntries(range.value(), listProperties);
            if (!rows)
                return fail(rows.error());
            for (const auto& row : rows.value())
                printRow(row);
            return 0;
        }

        store::EntryFilter filter;
        filter.propertyIds = listProperties;
        auto entries = store.listEntries(range.value(), filter);
        if (!entries)
            return fail(entries.error());

        sync::NameMap properties;
        sync::NameMap counterparties;
        if (auto all = store.listProperties())
            for (const auto& p : all.value())
                properties[p.id] = p.name;
        if (auto all = store.listCounterparties())
            for (const auto& c : all.value())
                counterparties[c.id] = c.name;

        for (const auto& e : entries.value()) {
            sync::LedgerRow row;
            row.id = e.id;
            row.date = displayDate(e.date);
            row.propertyName = properties.count(e.propertyId) ? properties[e.propertyId] : "";
            row.documentNumber = e.documentNumber;
            if (e.counterpartyId && counterparties.count(*e.counterpartyId))
                row.counterpartyName = counterparties[*e.counterpartyId];
            row.description = e.description;
            row.kindLabel = store::entryKindLabel(static_cast<int>(e.kind));
            row.credit = e.credit;
            row.debit = e.debit;
            row.signedBalance = e.signedClosingBalance();
            row.author = e.author;
            printRow(row);
        }
        return 0;
    }

    if (balances->parsed()) {
        auto rows = store.accountBalances();
        if (!rows)
            return fail(rows.error());
        for (const auto& b : rows.value())
            std::cout << fmt::format("account {:>4}  last entry {:>6}  balance {:>14.2f}\n",
                                     b.accountId, b.lastEntryId, b.balance);
        auto total = store.totalBalance();
        if (!total)
            return fail(total.error());
        std::cout << fmt::format("total {:>14.2f}\n", total.value());
        return 0;
    }

    if (summary->parsed()) {
        auto range = parseRange(summaryRange.from, summaryRange.to);
        if (!range)
            return fail(range.error());
        auto rows = store.categorySummary(range.value());
        if (!rows)
            return fail(rows.error());
        for (const auto& s : rows.value())
            std::cout << fmt::format("{:04}-{:02}  {:24.24}  in {:>12.2f}  out {:>12.2f}\n", s.year,
                                     s.month, s.category.empty() ? "(none)" : s.category,
                                     s.totalCredit, s.totalDebit);
        return 0;
    }

    if (archive->parsed()) {
        auto r = ctx.archiver().runIfDue();
        if (!r)
            return fail(r.error());
        if (r.value())
            std::cout << "Archived to " << r.value()->string() << "\n";
        else
            std::cout << "Nothing to archive\n";
        return 0;
    }

    if (pull->parsed()) {
        auto range = parseRange(pullRange.from, pullRange.to);
        if (!range)
            return fail(range.error());
        auto n = ctx.pullLedger(range.value());
        if (!n)
            return fail(n.error());
        std::cout << "Pulled " << n.value() << " entries\n";
        return 0;
    }

    if (push->parsed()) {
        auto range = parseRange(pushRange.from, pushRange.to);
        if (!range)
            return fail(range.error());
        auto entries = store.listEntries(range.value());
        if (!entries)
            return fail(entries.error());
        auto ledger = ctx.remoteLedger();
        if (!ledger)
            return fail(ledger.error());
        auto n = ledger.value()->pushEntries(entries.value());
        if (!n)
            return fail(n.error());
        std::cout << "Pushed " << n.value() << " entries\n";
        return 0;
    }

    if (watch->parsed()) {
        std::signal(SIGINT, on_signal);
        std::signal(SIGTERM, on_signal);

        if (auto r = ctx.watchLedger(); !r)
            return fail(r.error());
        std::cout << "Watching " << cfg.remoteTable << " (Ctrl-C to stop)\n";

        const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(watchSeconds);
        while (!g_stop.load()) {
            if (watchSeconds > 0 && std::chrono::steady_clock::now() >= deadline)
                break;
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        auto channel = ctx.realtime();
        ctx.shutdown();
        if (channel) {
            auto stats = channel.value()->stats();
            std::cout << fmt::format("delivered {}  stalls {}  applied {}  failed {}\n",
                                     stats.delivered, stats.stalls, ctx.changeApplier().applied(),
                                     ctx.changeApplier().failed());
        }
        return 0;
    }

    if (lookupCmd->parsed()) {
        auto record = ctx.identityLookup().lookup(lookupId);
        if (!record)
            return fail(record.error());
        if (lookup::IdentityLookup::isSentinel(record.value())) {
            std::cerr << "Registry unavailable (rate limited or network error)\n";
            return 3;
        }
        const auto name = lookup::IdentityLookup::extractName(record.value());
        std::cout << lookup::formatTaxId(lookupId) << "  " << (name.empty() ? "-" : name) << "\n";
        return 0;
    }

    if (users->parsed()) {
        auto& creds = ctx.credentials();
        if (usersAdd->parsed()) {
            if (auto r = creds.addUser(userName, userPassword); !r)
                return fail(r.error());
            std::cout << "Added " << userName << "\n";
        } else if (usersVerify->parsed()) {
            auto ok = creds.verifyUser(userName, userPassword);
            if (!ok)
                return fail(ok.error());
            std::cout << (ok.value() ? "ok" : "denied") << "\n";
            return ok.value() ? 0 : 4;
        } else if (usersRemove->parsed()) {
            if (auto r = creds.removeUser(userName); !r)
                return fail(r.error());
            std::cout << "Removed " << userName << "\n";
        } else if (usersList->parsed()) {
            auto names = creds.listUsers();
            if (!names)
                return fail(names.error());
            for (const auto& n : names.value())
                std::cout << n << "\n";
        }
        return 0;
    }

    if (adminPasswd->parsed()) {
        if (auto r = ctx.credentials().changeAdminPassword(adminCurrent, adminNext); !r)
            return fail(r.error());
        std::cout << "Administrator password changed\n";
        return 0;
    }

    if (login->parsed()) {
        auto ledger = ctx.remoteLedger();
        if (!ledger)
            return fail(ledger.error());
        if (loginAdmin) {
            if (auto r = ledger.value()->signInAdmin(loginName, loginPassword); !r)
                return fail(r.error());
            std::cout << "Signed in as " << loginName << "\n";
            return 0;
        }
        auto user = ledger.value()->loginUser(loginName, loginPassword);
        if (!user)
            return fail(user.error());
        if (!user.value()) {
            std::cout << "denied\n";
            return 4;
        }
        std::cout << "Logged in as " << user.value()->username << " (id " << user.value()->id
                  << ")\n";
        return 0;
    }

    return 0;
}
