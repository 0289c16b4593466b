#include <catch2/catch_test_macros.hpp>
#include "secretkit/service/secret_service.hpp"
#include "secretkit/crypto/sodium_interop.hpp"
#include "helpers/mock_secret_service_bus.hpp"
using namespace secretkit::service;
using namespace secretkit::service::test_helpers;

namespace {
    const std::vector<uint8_t> kPassword = {'h', 'u', 'n', 't', 'e', 'r', '2'};
}

TEST_CASE("SecretService - Connect", "[service]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    MockSecretServiceBus bus;
    SECTION("Negotiates exactly one session") {
        auto service = SecretService::Connect(bus, ServiceConfig::Default());
        REQUIRE(service.IsOk());
        REQUIRE(bus.OpenSessionCalls() == 1);
        REQUIRE(service.Unwrap()->GetSession().GetType() == enums::EncryptionType::Dh);
        REQUIRE_FALSE(service.Unwrap()->GetPromptTimeout().has_value());
    }
    SECTION("Prompt timeout is converted to milliseconds") {
        auto service = SecretService::Connect(
            bus, ServiceConfig::PlainText().WithPromptTimeout(std::chrono::seconds{2})).Unwrap();
        REQUIRE(service->GetPromptTimeout() == std::chrono::milliseconds{2000});
    }
    SECTION("Huge prompt timeout saturates instead of wrapping") {
        const auto login = bus.AddCollection("login", "Login", true);
        bus.RequirePrompt(MockOperation::Unlock);
        auto service = SecretService::Connect(
            bus, ServiceConfig::PlainText().WithPromptTimeout(std::chrono::seconds{10'000'000'000'000'000})).Unwrap();
        REQUIRE(service->GetPromptTimeout() == std::chrono::milliseconds::max());

        REQUIRE(service->LockUnlockAll(LockAction::Unlock, {ObjectPath::Create(login).Unwrap()}).IsOk());
        REQUIRE(bus.WaitTimeouts().size() == 1);
        REQUIRE(bus.WaitTimeouts().front().has_value());
        REQUIRE(*bus.WaitTimeouts().front() > std::chrono::hours{24 * 365});
        REQUIRE(bus.DismissCalls() == 0);
        REQUIRE_FALSE(bus.IsObjectLocked(login));
    }
    SECTION("Negotiation failure aborts the connection") {
        bus.SetSupportsDh(false);
        auto service = SecretService::Connect(bus, ServiceConfig::Default());
        REQUIRE(service.IsErr());
        REQUIRE(service.UnwrapErr().Is(SecretServiceFailureType::Negotiation));
    }
}

TEST_CASE("SecretService - Collections", "[service]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    auto bus = MockSecretServiceBus::WithDefaultCollection();
    auto service = SecretService::Connect(*bus, ServiceConfig::PlainText()).Unwrap();

    SECTION("Default alias resolves") {
        auto collection = service->GetDefaultCollection();
        REQUIRE(collection.IsOk());
        REQUIRE(collection.Unwrap().GetPath().Value() == MockSecretServiceBus::DEFAULT_COLLECTION);
        REQUIRE(collection.Unwrap().GetLabel().Unwrap() == "Login");
    }
    SECTION("Unbound alias is NoResult") {
        auto collection = service->GetCollectionByAlias("nonexistent");
        REQUIRE(collection.IsErr());
        REQUIRE(collection.UnwrapErr().Is(SecretServiceFailureType::NoResult));
    }
    SECTION("Any collection falls back to the session alias") {
        MockSecretServiceBus other;
        auto session_path = other.AddCollection("session", "Session", false);
        other.SetAlias("session", session_path);
        auto other_service = SecretService::Connect(other, ServiceConfig::PlainText()).Unwrap();
        REQUIRE(other_service->GetAnyCollection().Unwrap().GetPath().Value() == session_path);
    }
    SECTION("Any collection falls back to the first listed one") {
        MockSecretServiceBus other;
        auto path = other.AddCollection("work", "Work", false);
        auto other_service = SecretService::Connect(other, ServiceConfig::PlainText()).Unwrap();
        REQUIRE(other_service->GetAnyCollection().Unwrap().GetPath().Value() == path);
    }
    SECTION("Any collection skips an alias lookup that fails") {
        bus->SetRawAliasReply("default", "not an object path");
        auto session_path = bus->AddCollection("session", "Session", false);
        bus->SetAlias("session", session_path);
        auto by_default = service->GetDefaultCollection();
        REQUIRE(by_default.IsErr());
        REQUIRE(by_default.UnwrapErr().Is(SecretServiceFailureType::InvalidInput));
        REQUIRE(service->GetAnyCollection().Unwrap().GetPath().Value() == session_path);
    }
    SECTION("Any collection reports the listing failure when every lookup fails") {
        bus->SetTransportDown(true);
        auto result = service->GetAnyCollection();
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().Is(SecretServiceFailureType::Transport));
    }
    SECTION("No collections at all") {
        MockSecretServiceBus empty;
        auto empty_service = SecretService::Connect(empty, ServiceConfig::PlainText()).Unwrap();
        auto result = empty_service->GetAnyCollection();
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().Is(SecretServiceFailureType::NoResult));
    }
    SECTION("Create without prompt") {
        auto created = service->CreateCollection("Work", "work");
        REQUIRE(created.IsOk());
        REQUIRE(created.Unwrap().GetLabel().Unwrap() == "Work");
        REQUIRE(service->GetCollectionByAlias("work").Unwrap() == created.Unwrap());
        REQUIRE(service->GetAllCollections().Unwrap().size() == 2);
        REQUIRE(bus->PromptCalls() == 0);
    }
    SECTION("Create through a prompt") {
        bus->RequirePrompt(MockOperation::CreateCollection);
        auto created = service->CreateCollection("Work", "");
        REQUIRE(created.IsOk());
        REQUIRE(bus->PromptCalls() == 1);
        REQUIRE(bus->HasObject(created.Unwrap().GetPath().Value()));
    }
    SECTION("Dismissed create prompt") {
        bus->RequirePrompt(MockOperation::CreateCollection);
        bus->SetPromptOutcome(PromptOutcome::Dismiss);
        auto created = service->CreateCollection("Work", "");
        REQUIRE(created.IsErr());
        REQUIRE(created.UnwrapErr().Is(SecretServiceFailureType::PromptDismissed));
        REQUIRE(service->GetAllCollections().Unwrap().size() == 1);
    }
    SECTION("Label round trip") {
        auto collection = service->GetDefaultCollection().Unwrap();
        REQUIRE(collection.SetLabel("Renamed").IsOk());
        REQUIRE(collection.GetLabel().Unwrap() == "Renamed");
    }
    SECTION("Lock state") {
        auto collection = service->GetDefaultCollection().Unwrap();
        REQUIRE_FALSE(collection.IsLocked().Unwrap());
        REQUIRE(collection.Lock().IsOk());
        REQUIRE(collection.IsLocked().Unwrap());
        REQUIRE(collection.EnsureUnlocked().IsOk());
        REQUIRE_FALSE(collection.IsLocked().Unwrap());
    }
    SECTION("EnsureUnlocked on an unlocked collection makes no call") {
        auto collection = service->GetDefaultCollection().Unwrap();
        REQUIRE(collection.EnsureUnlocked().IsOk());
        REQUIRE(bus->UnlockCalls() == 0);
    }
    SECTION("Delete removes the collection and its items") {
        auto collection = service->CreateCollection("Temp", "").Unwrap();
        REQUIRE(collection.CreateItem("x", {{"k", "v"}}, kPassword, false, "text/plain").IsOk());
        REQUIRE(collection.Delete().IsOk());
        REQUIRE_FALSE(bus->HasObject(collection.GetPath().Value()));
        REQUIRE(service->SearchItems({{"k", "v"}}).Unwrap().unlocked.empty());
    }
}

TEST_CASE("SecretService - Items", "[service]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    auto bus = MockSecretServiceBus::WithDefaultCollection();
    auto service = SecretService::Connect(*bus, ServiceConfig::Default()).Unwrap();
    auto collection = service->GetDefaultCollection().Unwrap();
    const Attributes attributes = {{"service", "mail"}, {"user", "alice"}};

    SECTION("Secret is encrypted on the bus and readable back") {
        auto item = collection.CreateItem("Mail", attributes, kPassword, false, "text/plain").Unwrap();
        REQUIRE(bus->LastStoredSecret().parameters.size() == 16);
        REQUIRE(bus->LastStoredSecret().value != kPassword);
        REQUIRE(bus->PlaintextOf(item.GetPath().Value()) == kPassword);
        REQUIRE(item.GetSecret().Unwrap() == kPassword);
        REQUIRE(item.GetSecretContentType().Unwrap() == "text/plain");
    }
    SECTION("Replace overwrites an item with identical attributes") {
        auto first = collection.CreateItem("Mail", attributes, kPassword, true, "text/plain").Unwrap();
        const std::vector<uint8_t> rotated = {'n', 'e', 'w'};
        auto second = collection.CreateItem("Mail", attributes, rotated, true, "text/plain").Unwrap();
        REQUIRE(first == second);
        REQUIRE(second.GetSecret().Unwrap() == rotated);
        REQUIRE(collection.GetAllItems().Unwrap().size() == 1);
    }
    SECTION("Without replace a duplicate is created") {
        REQUIRE(collection.CreateItem("Mail", attributes, kPassword, false, "text/plain").IsOk());
        REQUIRE(collection.CreateItem("Mail", attributes, kPassword, false, "text/plain").IsOk());
        REQUIRE(collection.SearchItems(attributes).Unwrap().size() == 2);
    }
    SECTION("Create through a prompt") {
        bus->RequirePrompt(MockOperation::CreateItem);
        auto item = collection.CreateItem("Mail", attributes, kPassword, false, "text/plain");
        REQUIRE(item.IsOk());
        REQUIRE(bus->PromptCalls() == 1);
        REQUIRE(item.Unwrap().GetSecret().Unwrap() == kPassword);
    }
    SECTION("Properties") {
        auto item = collection.CreateItem("Mail", attributes, kPassword, false, "text/plain").Unwrap();
        REQUIRE(item.GetLabel().Unwrap() == "Mail");
        REQUIRE(item.GetAttributes().Unwrap() == attributes);
        const auto created = item.GetCreated().Unwrap();
        REQUIRE(item.SetLabel("Mail (work)").IsOk());
        REQUIRE(item.SetAttributes({{"service", "mail"}}).IsOk());
        REQUIRE(item.GetLabel().Unwrap() == "Mail (work)");
        REQUIRE(item.GetAttributes().Unwrap().size() == 1);
        REQUIRE(item.GetModified().Unwrap() > created);
    }
    SECTION("SetSecret replaces the value and content type") {
        auto item = collection.CreateItem("Mail", attributes, kPassword, false, "text/plain").Unwrap();
        const std::vector<uint8_t> blob = {0x00, 0x01, 0x02};
        REQUIRE(item.SetSecret(blob, "application/octet-stream").IsOk());
        REQUIRE(item.GetSecret().Unwrap() == blob);
        REQUIRE(item.GetSecretContentType().Unwrap() == "application/octet-stream");
    }
    SECTION("Locked item secret is unavailable until unlocked") {
        auto item = collection.CreateItem("Mail", attributes, kPassword, false, "text/plain").Unwrap();
        REQUIRE(item.Lock().IsOk());
        REQUIRE(item.IsLocked().Unwrap());
        REQUIRE(item.GetSecret().IsErr());
        REQUIRE(item.EnsureUnlocked().IsOk());
        REQUIRE(item.GetSecret().Unwrap() == kPassword);
    }
    SECTION("Service-wide search splits locked and unlocked") {
        auto open = collection.CreateItem("a", {{"app", "x"}, {"n", "1"}}, kPassword, false, "text/plain").Unwrap();
        auto shut = collection.CreateItem("b", {{"app", "x"}, {"n", "2"}}, kPassword, false, "text/plain").Unwrap();
        REQUIRE(shut.Lock().IsOk());
        auto found = service->SearchItems({{"app", "x"}}).Unwrap();
        REQUIRE(found.unlocked.size() == 1);
        REQUIRE(found.locked.size() == 1);
        REQUIRE(found.unlocked.front() == open);
        REQUIRE(found.locked.front() == shut);

        bus->RequirePrompt(MockOperation::Unlock);
        REQUIRE(service->UnlockAll(found.locked).IsOk());
        REQUIRE(bus->PromptCalls() == 1);
        REQUIRE_FALSE(shut.IsLocked().Unwrap());
    }
    SECTION("LockAll locks every item in one call") {
        auto a = collection.CreateItem("a", {{"n", "1"}}, kPassword, false, "text/plain").Unwrap();
        auto b = collection.CreateItem("b", {{"n", "2"}}, kPassword, false, "text/plain").Unwrap();
        REQUIRE(service->LockAll({a, b}).IsOk());
        REQUIRE(bus->LockCalls() == 1);
        REQUIRE(a.IsLocked().Unwrap());
        REQUIRE(b.IsLocked().Unwrap());
    }
    SECTION("Malformed prompt reference fails the delete") {
        auto item = collection.CreateItem("Mail", attributes, kPassword, false, "text/plain").Unwrap();
        bus->RequirePrompt(MockOperation::Delete);
        bus->SetMalformedPromptPaths(true);
        auto deleted = item.Delete();
        REQUIRE(deleted.IsErr());
        REQUIRE(deleted.UnwrapErr().Is(SecretServiceFailureType::InvalidInput));
        REQUIRE(bus->PromptCalls() == 0);
        REQUIRE(bus->ItemCount() == 1);
    }
    SECTION("Delete through a prompt") {
        auto item = collection.CreateItem("Mail", attributes, kPassword, false, "text/plain").Unwrap();
        bus->RequirePrompt(MockOperation::Delete);
        REQUIRE(item.Delete().IsOk());
        REQUIRE(bus->PromptCalls() == 1);
        REQUIRE(bus->ItemCount() == 0);
    }
}
