#include <catch2/catch_test_macros.hpp>
#include "core/lifecycle_manager.hpp"
#include "core/utils.hpp"
#include "mocks/mock_inspection_engine.hpp"

#include <format>
#include <filesystem>
#include <fstream>
#include <thread>
#include <vector>

using namespace wafgate;
using namespace wafgate::test;

namespace {

namespace fs = std::filesystem;

// Temporary rule directory, removed on scope exit
struct RuleDir {
    fs::path dir;

    RuleDir() {
        dir = fs::temp_directory_path() / ("wafgate_rules_" + utils::generate_uuid());
        fs::create_directories(dir);
    }

    ~RuleDir() {
        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    std::string add(const std::string& name, const std::string& content = "SecRuleEngine On\n") {
        std::ofstream(dir / name) << content;
        return (dir / name).string();
    }
};

WafConfig config_for(const std::vector<std::string>& files) {
    WafConfig cfg = WafConfig::defaults();
    cfg.directives_files = files;
    return cfg;
}

} // anonymous namespace

TEST_CASE("LifecycleManager: starts uninitialized", "[lifecycle]") {
    LifecycleManager lm;
    REQUIRE(lm.state() == LifecycleManager::State::UNINITIALIZED);
    REQUIRE_FALSE(lm.failed());
    REQUIRE(lm.engine() == nullptr);
    REQUIRE(lm.new_transaction({}) == nullptr);
    REQUIRE(lm.block_message() == kDefaultBlockMessage);
}

TEST_CASE("LifecycleManager: successful initialization", "[lifecycle]") {
    RuleDir rules;
    const auto path = rules.add("base.conf");
    MockEngineFactory factory{std::make_shared<MockEngine>()};

    LifecycleManager lm;
    lm.initialize(config_for({path}), factory.as_factory());

    REQUIRE(lm.state() == LifecycleManager::State::READY);
    REQUIRE(lm.engine() == factory.engine);
    REQUIRE(*factory.calls == 1);
    REQUIRE(factory.seen->resolved_directives.size() == 1);
    REQUIRE(fs::path(factory.seen->resolved_directives[0]).is_absolute());
    REQUIRE(factory.seen->on_matched_rule);   // error log on by default
    REQUIRE_FALSE(lm.context_aware());
    REQUIRE(lm.new_transaction({}) != nullptr);
}

TEST_CASE("LifecycleManager: later calls are no-ops", "[lifecycle]") {
    RuleDir rules;
    const auto path = rules.add("base.conf");
    MockEngineFactory first{std::make_shared<MockEngine>()};
    MockEngineFactory second{std::make_shared<MockEngine>()};

    LifecycleManager lm;
    lm.initialize(config_for({path}), first.as_factory());
    lm.initialize(config_for({path}), second.as_factory());
    lm.initialize(config_for({"/does/not/exist.conf"}), second.as_factory());

    REQUIRE(*first.calls == 1);
    REQUIRE(*second.calls == 0);
    REQUIRE(lm.engine() == first.engine);
}

TEST_CASE("LifecycleManager: concurrent initialization constructs once", "[lifecycle]") {
    constexpr int kThreads = 8;
    RuleDir rules;

    // Every thread races with its own config and its own engine
    std::vector<WafConfig> configs;
    std::vector<MockEngineFactory> factories;
    for (int i = 0; i < kThreads; ++i) {
        configs.push_back(config_for({rules.add(std::format("rules_{}.conf", i))}));
        configs.back().rule_engine = (i % 2 == 0) ? "On" : "DetectionOnly";
        factories.push_back(MockEngineFactory{std::make_shared<MockEngine>()});
    }

    LifecycleManager lm;
    std::vector<const IInspectionEngine*> observed(kThreads, nullptr);
    std::vector<std::thread> threads;
    for (int i = 0; i < kThreads; ++i) {
        threads.emplace_back([&, i] {
            lm.initialize(configs[i], factories[i].as_factory());
            observed[i] = lm.engine().get();
        });
    }
    for (auto& t : threads) t.join();

    int constructions = 0;
    const IInspectionEngine* winner = nullptr;
    for (const auto& f : factories) {
        constructions += *f.calls;
        if (*f.calls == 1) winner = f.engine.get();
    }
    REQUIRE(constructions == 1);
    REQUIRE(winner != nullptr);
    REQUIRE(lm.state() == LifecycleManager::State::READY);
    for (const auto* engine : observed) {
        REQUIRE(engine == winner);
    }
}

TEST_CASE("LifecycleManager: missing rule file is fatal once", "[lifecycle]") {
    RuleDir rules;
    const auto good = rules.add("base.conf");
    const auto missing = (rules.dir / "missing.conf").string();
    MockEngineFactory factory{std::make_shared<MockEngine>()};

    LifecycleManager lm;
    REQUIRE_THROWS_AS(lm.initialize(config_for({good, missing}), factory.as_factory()),
                      RuleSourceError);
    REQUIRE(lm.failed());
    REQUIRE(lm.init_error().find("missing.conf") != std::string::npos);
    REQUIRE(*factory.calls == 0);

    // Permanent: no retry, no second throw
    REQUIRE_NOTHROW(lm.initialize(config_for({good}), factory.as_factory()));
    REQUIRE(lm.failed());
    REQUIRE(*factory.calls == 0);
    REQUIRE(lm.engine() == nullptr);
}

TEST_CASE("LifecycleManager: engine rejection is recorded, not thrown", "[lifecycle]") {
    RuleDir rules;
    const auto path = rules.add("bad.conf", "SecRule garbage");

    LifecycleManager lm;
    SECTION("factory returns an error") {
        REQUIRE_NOTHROW(lm.initialize(config_for({path}), [](const EngineConfig&) {
            return Result<std::shared_ptr<IInspectionEngine>>::error(
                ErrorCategory::INITIALIZATION_ERROR, "syntax error at line 1");
        }));
        REQUIRE(lm.init_error().find("syntax error at line 1") != std::string::npos);
    }
    SECTION("factory throws") {
        REQUIRE_NOTHROW(lm.initialize(config_for({path}), [](const EngineConfig&)
                -> Result<std::shared_ptr<IInspectionEngine>> {
            throw std::runtime_error("parser exploded");
        }));
        REQUIRE(lm.init_error().find("parser exploded") != std::string::npos);
    }
    SECTION("factory returns null") {
        lm.initialize(config_for({path}), [](const EngineConfig&) {
            return Result<std::shared_ptr<IInspectionEngine>>::ok(nullptr);
        });
    }

    REQUIRE(lm.failed());
    REQUIRE(lm.engine() == nullptr);
}

TEST_CASE("LifecycleManager: relative rule paths resolve against root_dir", "[lifecycle]") {
    RuleDir rules;
    rules.add("crs.conf");
    MockEngineFactory factory{std::make_shared<MockEngine>()};

    WafConfig cfg = config_for({"crs.conf"});
    cfg.root_dir = rules.dir;

    LifecycleManager lm;
    lm.initialize(cfg, factory.as_factory());
    REQUIRE(lm.state() == LifecycleManager::State::READY);
    REQUIRE(fs::path(factory.seen->resolved_directives[0]) == fs::absolute(rules.dir / "crs.conf"));
}

TEST_CASE("LifecycleManager: rule files are passed in order", "[lifecycle]") {
    RuleDir rules;
    const auto a = rules.add("a.conf");
    const auto b = rules.add("b.conf");
    MockEngineFactory factory{std::make_shared<MockEngine>()};

    LifecycleManager lm;
    lm.initialize(config_for({b, a}), factory.as_factory());
    REQUIRE(factory.seen->resolved_directives.size() == 2);
    REQUIRE(fs::path(factory.seen->resolved_directives[0]).filename() == "b.conf");
    REQUIRE(fs::path(factory.seen->resolved_directives[1]).filename() == "a.conf");
}

TEST_CASE("LifecycleManager: directives-only overload", "[lifecycle]") {
    RuleDir rules;
    const auto path = rules.add("only.conf");
    MockEngineFactory factory{std::make_shared<MockEngine>()};

    LifecycleManager lm;
    lm.initialize(std::vector<std::string>{path}, factory.as_factory());
    REQUIRE(lm.state() == LifecycleManager::State::READY);
    REQUIRE(factory.seen->waf.directives_files == std::vector<std::string>{path});
    REQUIRE_FALSE(factory.seen->waf.request_body_access);
}

TEST_CASE("LifecycleManager: empty directives fall back to defaults", "[lifecycle]") {
    // Default rule file is relative to the working directory and absent here
    MockEngineFactory factory{std::make_shared<MockEngine>()};
    LifecycleManager lm;
    REQUIRE_THROWS_AS(lm.initialize(std::vector<std::string>{}, factory.as_factory()),
                      RuleSourceError);
    REQUIRE(lm.init_error().find("wafgate.conf") != std::string::npos);
}

TEST_CASE("LifecycleManager: context-aware engines are detected", "[lifecycle]") {
    RuleDir rules;
    const auto path = rules.add("base.conf");
    auto engine = std::make_shared<MockContextAwareEngine>();
    MockEngineFactory factory{engine};

    LifecycleManager lm;
    lm.initialize(config_for({path}), factory.as_factory());
    REQUIRE(lm.context_aware());

    std::stop_source stop;
    auto tx = lm.new_transaction(TransactionOptions{"tx-1", stop.get_token()});
    REQUIRE(tx != nullptr);
    REQUIRE(engine->context_calls.load() == 1);
    REQUIRE(engine->plain_calls.load() == 0);
    REQUIRE(engine->last()->id == "tx-1");
    REQUIRE(engine->last()->has_stop_token);
}

TEST_CASE("LifecycleManager: block message", "[lifecycle]") {
    LifecycleManager lm;
    lm.set_block_message(std::nullopt);
    REQUIRE(lm.block_message() == kDefaultBlockMessage);
    lm.set_block_message(std::string{});
    REQUIRE(lm.block_message() == kDefaultBlockMessage);
    lm.set_block_message("Access denied");
    REQUIRE(lm.block_message() == "Access denied");
}

TEST_CASE("LifecycleManager: error log and debug sinks", "[lifecycle]") {
    RuleDir rules;
    const auto path = rules.add("base.conf");
    MockEngineFactory factory{std::make_shared<MockEngine>()};

    WafConfig cfg = config_for({path});
    cfg.enable_error_log = false;
    std::vector<std::string> lines;
    cfg.debug_logger = [&lines](std::string_view line) { lines.emplace_back(line); };

    LifecycleManager lm;
    lm.initialize(cfg, factory.as_factory());
    REQUIRE_FALSE(factory.seen->on_matched_rule);
    REQUIRE(factory.seen->on_debug);
    factory.seen->on_debug("rule 5 evaluated");
    REQUIRE(lines == std::vector<std::string>{"rule 5 evaluated"});
}

TEST_CASE("LifecycleManager: non-exception throw from the factory fails once", "[lifecycle]") {
    RuleDir rules;
    const auto path = rules.add("base.conf");
    int calls = 0;
    auto throwing = [&calls](const EngineConfig&) -> Result<std::shared_ptr<IInspectionEngine>> {
        ++calls;
        throw 42;
    };

    LifecycleManager lm;
    REQUIRE_NOTHROW(lm.initialize(config_for({path}), throwing));
    REQUIRE(lm.failed());
    REQUIRE(lm.init_error().find("unknown exception") != std::string::npos);

    REQUIRE_NOTHROW(lm.initialize(config_for({path}), throwing));
    REQUIRE(calls == 1);
    REQUIRE(lm.engine() == nullptr);
}
