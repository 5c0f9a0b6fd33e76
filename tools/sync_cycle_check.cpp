#include <QCommandLineParser>
#include <QCoreApplication>
#include <QJsonObject>
#include <sodium.h>

#include "core/logging.hpp"
#include "network/loopback_server.hpp"
#include "sync/memory_data_source.hpp"
#include "sync/sync_manager.hpp"

#include <chrono>
#include <cstdio>
#include <memory>
#include <string>
#include <vector>

namespace {

using namespace braid;
using namespace braid::sync;

constexpr auto kEmail = "check@example.com";
constexpr auto kToken = "check-token";
constexpr auto kPassword = "correct horse battery staple";

struct Device {
    std::unique_ptr<SyncManager> manager;
    std::shared_ptr<MemoryDataSource> bookmarks;
    std::shared_ptr<MemoryDataSource> passwords;
    std::vector<SyncDataType> types;
};

Device make_device(const std::shared_ptr<network::LoopbackSyncServer>& server,
                   const std::string& name,
                   ConflictStrategy strategy) {
    SyncConfig config;
    config.device_id = Uuid::generate().to_string();
    config.device_name = name;
    config.conflict_strategy = strategy;

    auto created = SyncManager::create(config,
                                       std::make_shared<network::LoopbackTransport>(server));
    if (created.is_err()) {
        qCritical().noquote() << name.c_str() << "create failed:"
                              << created.unwrap_err().to_string().c_str();
        return {};
    }

    Device device;
    device.manager = std::move(created).unwrap();
    device.bookmarks = std::make_shared<MemoryDataSource>(SyncDataType::Bookmarks, config.device_id);
    device.manager->register_data_source(device.bookmarks);
    device.types.push_back(SyncDataType::Bookmarks);
    // AES-256-GCM needs hardware support; without it passwords stay local.
    if (crypto_aead_aes256gcm_is_available() != 0) {
        device.passwords = std::make_shared<MemoryDataSource>(SyncDataType::Passwords, config.device_id);
        device.manager->register_data_source(device.passwords);
        device.types.push_back(SyncDataType::Passwords);
    }

    auto account = SyncAccount::create(kEmail, "loopback://check",
                                       DeviceSettings::for_device(config.device_id, name));
    SyncAccountCredentials credentials;
    credentials.email = kEmail;
    credentials.auth_token = kToken;

    auto login = device.manager->login(account, credentials, kPassword);
    if (login.is_err()) {
        qCritical().noquote() << name.c_str() << "login failed:"
                              << login.unwrap_err().to_string().c_str();
        return {};
    }
    return device;
}

bool run_cycle(Device& device, const char* name) {
    auto result = device.manager->sync(device.types);
    if (result.is_err()) {
        qCritical().noquote() << name << "sync failed:" << result.unwrap_err().to_string().c_str();
        return false;
    }
    const auto& totals = result.unwrap();
    std::printf("%s: up=%llu down=%llu conflicts=%llu success=%s\n",
                name,
                static_cast<unsigned long long>(totals.changes_uploaded),
                static_cast<unsigned long long>(totals.changes_downloaded),
                static_cast<unsigned long long>(totals.conflicts_resolved),
                totals.success ? "yes" : "no");
    return totals.success;
}

} // namespace

int main(int argc, char** argv) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("sync_cycle_check"));

    QCommandLineParser parser;
    parser.setApplicationDescription(
        QStringLiteral("Runs two devices against an in-process sync server and checks they converge."));
    parser.addHelpOption();
    QCommandLineOption strategyOption(
        QStringList{QStringLiteral("s"), QStringLiteral("strategy")},
        QStringLiteral("Conflict strategy (last_write_wins, local_wins, remote_wins, merge, keep_both)."),
        QStringLiteral("name"),
        QStringLiteral("last_write_wins"));
    QCommandLineOption logFileOption(
        QStringLiteral("log-file"),
        QStringLiteral("Append log output to <path>."),
        QStringLiteral("path"));
    parser.addOption(strategyOption);
    parser.addOption(logFileOption);
    parser.process(app);

    if (parser.isSet(logFileOption) && !install_file_logging(parser.value(logFileOption))) {
        qWarning().noquote() << "Cannot open log file" << parser.value(logFileOption);
    }

    const auto strategy = parse_strategy(parser.value(strategyOption).toStdString());
    if (!strategy) {
        qCritical().noquote() << "Unknown strategy" << parser.value(strategyOption);
        return 1;
    }

    auto server = std::make_shared<network::LoopbackSyncServer>();
    server->register_account(kEmail, kToken);

    auto a = make_device(server, "A", *strategy);
    auto b = make_device(server, "B", *strategy);
    if (!a.manager || !b.manager) {
        return 1;
    }

    const auto base = Timestamp::now() - std::chrono::minutes(1);
    a.bookmarks->put("shared", QJsonObject{{"title", "From A"}, {"folder", "work"}}, base);
    a.bookmarks->put("only-a", QJsonObject{{"title", "A"}}, base);
    if (a.passwords) {
        a.passwords->put("login", QJsonObject{{"site", "example.com"}, {"user", "a"}}, base);
    } else {
        qInfo() << "AES-256-GCM unavailable, skipping passwords";
    }
    b.bookmarks->put("shared", QJsonObject{{"title", "From B"}, {"url", "https://b"}},
                     base + std::chrono::seconds(10));
    b.bookmarks->put("only-b", QJsonObject{{"title", "B"}}, base);

    // A, B, A: the last pass lets A see what B resolved.
    if (!run_cycle(a, "A") || !run_cycle(b, "B") || !run_cycle(a, "A")) {
        return 2;
    }

    // Under local_wins and remote_wins two devices that edited the same
    // entity may keep different copies of it.
    const bool one_sided = *strategy == ConflictStrategy::LocalWins ||
                           *strategy == ConflictStrategy::RemoteWins;
    std::vector<std::string> entities{"only-a", "only-b"};
    if (!one_sided) {
        entities.push_back("shared");
    }
    for (const auto& entity : entities) {
        if (a.bookmarks->get(entity) != b.bookmarks->get(entity)) {
            qCritical().noquote() << "Bookmark" << entity.c_str() << "diverged";
            return 3;
        }
    }
    if (a.passwords && a.passwords->get("login") != b.passwords->get("login")) {
        qCritical().noquote() << "Password entry diverged";
        return 3;
    }
    if (a.bookmarks->size() != 3 || b.bookmarks->size() != 3) {
        return 3;
    }

    std::printf("converged with %s\n", to_string(*strategy).c_str());
    return 0;
}
