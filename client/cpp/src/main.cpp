// lever-replay - replays a JSON operation script against a fresh deployment
//
// Each step prints one JSON result line on stdout; logs go to the "lever"
// logger.

#include "lever/lever.hpp"
#include "lever/log.hpp"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using json = nlohmann::json;
using namespace lever;

//------------------------------------------------------------------------------
// Options
//------------------------------------------------------------------------------

struct Options {
    std::string config_path;
    std::string script_path;
    std::string log_level = "warn";
    bool strict = false;
};

//------------------------------------------------------------------------------
// Script Errors
//------------------------------------------------------------------------------

class ScriptError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

//------------------------------------------------------------------------------
// Replay verifier: scripts carry no signatures
//------------------------------------------------------------------------------

class AcceptAllVerifier : public ISignatureVerifier {
public:
    bool verify(const Address&, const std::vector<uint8_t>&,
                const std::vector<uint8_t>&) const override {
        return true;
    }
};

//------------------------------------------------------------------------------
// Field Readers
//------------------------------------------------------------------------------

const json& field(const json& step, const char* key) {
    auto it = step.find(key);
    if (it == step.end()) {
        throw ScriptError(std::string("missing field '") + key + "'");
    }
    return *it;
}

Address address_field(const json& step, const char* key) {
    try {
        return address_from_json(field(step, key));
    } catch (const ConfigError& e) {
        throw ScriptError(std::string(key) + ": " + e.what());
    }
}

// Integer or decimal string, in raw 1e6 units
I128 amount_field(const json& step, const char* key, I128 fallback = 0, bool required = true) {
    auto it = step.find(key);
    if (it == step.end()) {
        if (required) throw ScriptError(std::string("missing field '") + key + "'");
        return fallback;
    }
    if (it->is_number_integer()) {
        return static_cast<I128>(it->get<int64_t>());
    }
    if (it->is_string()) {
        auto v = e6::parse_i128(it->get_ref<const std::string&>());
        if (v) return *v;
    }
    throw ScriptError(std::string("field '") + key + "' is not an integer amount");
}

int64_t price_field(const json& step, const char* key) {
    I128 v = amount_field(step, key, 0, false);
    if (!e6::fits_i64(v)) throw ScriptError(std::string("field '") + key + "' out of range");
    return static_cast<int64_t>(v);
}

uint64_t uint_field(const json& step, const char* key) {
    const json& v = field(step, key);
    if (!v.is_number_unsigned()) {
        throw ScriptError(std::string("field '") + key + "' must be an unsigned integer");
    }
    return v.get<uint64_t>();
}

uint32_t u32_field(const json& step, const char* key) {
    uint64_t v = uint_field(step, key);
    if (v > std::numeric_limits<uint32_t>::max()) {
        throw ScriptError(std::string("field '") + key + "' out of range");
    }
    return static_cast<uint32_t>(v);
}

std::vector<uint64_t> ids_field(const json& step) {
    const json& v = field(step, "ids");
    if (!v.is_array()) throw ScriptError("field 'ids' must be an array");
    std::vector<uint64_t> ids;
    for (const auto& id : v) {
        if (!id.is_number_unsigned()) throw ScriptError("trade ids must be unsigned integers");
        ids.push_back(id.get<uint64_t>());
    }
    return ids;
}

Side side_field(const json& step) {
    const json& v = field(step, "side");
    if (v == "long") return Side::LONG;
    if (v == "short") return Side::SHORT;
    throw ScriptError("side must be 'long' or 'short'");
}

CloseReason reason_field(const json& step) {
    const json& v = field(step, "reason");
    if (v == "market") return CloseReason::MARKET;
    if (v == "stop_loss") return CloseReason::STOP_LOSS;
    if (v == "take_profit") return CloseReason::TAKE_PROFIT;
    if (v == "liquidation") return CloseReason::LIQUIDATION;
    throw ScriptError("unknown close reason");
}

// Inline {"prices":[...]} object, or a string carrying the raw proof
Proof proof_field(const json& step) {
    const json& v = field(step, "proof");
    std::string text = v.is_string() ? v.get<std::string>() : v.dump();
    return Proof(text.begin(), text.end());
}

OpenRequest open_request(const json& step) {
    OpenRequest req{};
    req.asset = u32_field(step, "asset");
    req.side = side_field(step);
    req.leverage = u32_field(step, "leverage");
    req.lots = uint_field(step, "lots");
    req.target_price = price_field(step, "target");
    req.stop_loss = price_field(step, "stop_loss");
    req.take_profit = price_field(step, "take_profit");
    return req;
}

json trade_json(const Trade& t) {
    return json{
        {"id", t.id},
        {"owner", addresses::to_hex(t.owner)},
        {"asset", t.asset},
        {"side", to_string(t.side)},
        {"lots", t.lots},
        {"leverage", t.leverage},
        {"state", to_string(t.state)},
        {"entry_price", e6::format(t.entry_price)},
        {"target_price", e6::format(t.target_price)},
        {"stop_loss", e6::format(t.stop_loss)},
        {"take_profit", e6::format(t.take_profit)},
        {"liquidation_price", e6::format(t.liquidation_price)},
        {"margin", e6::format(t.margin)},
        {"close_price", e6::format(t.close_price)},
        {"realized_pnl", e6::format(t.realized_pnl)},
        {"close_reason", to_string(t.close_reason)},
    };
}

json batch_json(const BatchResult& r) {
    json outcomes = json::array();
    for (const auto& o : r.outcomes) {
        outcomes.push_back({{"id", o.trade_id}, {"status", errors::to_string(o.status)}});
    }
    return json{{"processed", r.processed}, {"skipped", r.skipped}, {"outcomes", outcomes}};
}

//------------------------------------------------------------------------------
// Replay
//------------------------------------------------------------------------------

class Replay {
public:
    explicit Replay(Lever& lever) : lever_(lever) {
        lever_.set_clock([this] { return now_; });
    }

    // Returns the step's status; details are merged into `out`
    int32_t run(const json& step, json& out) {
        const std::string op = field(step, "op").get<std::string>();
        PositionEngine& engine = lever_.engine();
        CustodyLedger& ledger = lever_.ledger();

        if (op == "set_time") {
            now_ = uint_field(step, "time");
            return errors::OK;
        }
        if (op == "deposit") {
            return ledger.deposit(address_field(step, "account"), amount_field(step, "amount"));
        }
        if (op == "withdraw") {
            return ledger.withdraw(address_field(step, "account"), amount_field(step, "amount"));
        }
        if (op == "fund_pool") {
            return ledger.fund_pool(address_field(step, "caller"), amount_field(step, "amount"));
        }
        if (op == "defund_pool") {
            return ledger.defund_pool(address_field(step, "caller"), amount_field(step, "amount"));
        }
        if (op == "add_liquidity") {
            I128 shares = 0;
            int32_t status = ledger.add_liquidity(address_field(step, "investor"),
                                                  amount_field(step, "amount"), &shares);
            out["shares"] = e6::to_string(shares);
            return status;
        }
        if (op == "remove_liquidity") {
            I128 amount = 0;
            int32_t status = ledger.remove_liquidity(address_field(step, "investor"),
                                                     amount_field(step, "shares"), &amount);
            out["amount"] = e6::to_string(amount);
            return status;
        }
        if (op == "claim_owner_fees") {
            I128 amount = 0;
            int32_t status = ledger.claim_owner_fees(address_field(step, "caller"), &amount);
            out["amount"] = e6::to_string(amount);
            return status;
        }
        if (op == "open_limit") {
            OpenResult r = engine.open_limit(address_field(step, "trader"), open_request(step));
            out["trade_id"] = r.trade_id;
            return r.status;
        }
        if (op == "open_market") {
            OpenResult r = engine.open_market(address_field(step, "trader"), open_request(step),
                                              proof_field(step));
            out["trade_id"] = r.trade_id;
            return r.status;
        }
        if (op == "update_stops") {
            return engine.update_stops(address_field(step, "trader"), uint_field(step, "id"),
                                       price_field(step, "stop_loss"),
                                       price_field(step, "take_profit"));
        }
        if (op == "cancel") {
            return engine.cancel(address_field(step, "trader"), uint_field(step, "id"));
        }
        if (op == "close_market") {
            CloseResult r = engine.close_market(address_field(step, "trader"),
                                                uint_field(step, "id"), proof_field(step));
            out["exit_price"] = e6::format(r.exit_price);
            out["pnl"] = e6::format(r.pnl);
            return r.status;
        }
        if (op == "execute") {
            return engine.execute(address_field(step, "caller"), uint_field(step, "id"),
                                  proof_field(step));
        }
        if (op == "close") {
            CloseResult r = engine.close(address_field(step, "caller"), uint_field(step, "id"),
                                         reason_field(step), proof_field(step));
            out["exit_price"] = e6::format(r.exit_price);
            out["pnl"] = e6::format(r.pnl);
            return r.status;
        }
        if (op == "exec_limits") {
            BatchResult r = engine.exec_limits(address_field(step, "caller"),
                                               u32_field(step, "asset"),
                                               ids_field(step), proof_field(step));
            out.update(batch_json(r));
            return r.status;
        }
        if (op == "close_batch") {
            BatchResult r = engine.close_batch(address_field(step, "caller"),
                                               u32_field(step, "asset"),
                                               reason_field(step), ids_field(step),
                                               proof_field(step));
            out.update(batch_json(r));
            return r.status;
        }
        if (op == "relay") {
            return relay(step, out);
        }
        if (op == "set_market_open") {
            const json& open = field(step, "open");
            if (!open.is_boolean()) throw ScriptError("field 'open' must be a boolean");
            return lever_.registry().set_market_open(
                u32_field(step, "asset"), open.get<bool>());
        }
        if (op == "set_funding_rate") {
            return lever_.registry().set_funding_rate(
                u32_field(step, "asset"), price_field(step, "rate_ppm"));
        }
        if (op == "account") {
            Address who = address_field(step, "account");
            out["balance"] = e6::format(ledger.balance(who));
            out["locked"] = e6::format(ledger.locked(who));
            out["available"] = e6::format(ledger.available(who));
            return errors::OK;
        }
        if (op == "trade") {
            auto t = engine.trade(uint_field(step, "id"));
            if (!t) return errors::TRADE_NOT_FOUND;
            out["trade"] = trade_json(*t);
            return errors::OK;
        }
        if (op == "stats") {
            Lever::Stats s = lever_.stats();
            out["trades"] = s.trades;
            out["orders"] = s.orders;
            out["open"] = s.open_positions;
            out["closed"] = s.closed;
            out["cancelled"] = s.cancelled;
            out["pool_liquidity"] = e6::format(s.pool.liquidity);
            out["owner_fees"] = e6::format(s.pool.owner_fees);
            out["total_value"] = e6::format(s.total_value);
            return errors::OK;
        }

        throw ScriptError("unknown op '" + op + "'");
    }

private:
    Lever& lever_;
    uint64_t now_ = 0;

    int32_t relay(const json& step, json& out) {
        Relayer* relayer = lever_.relayer();
        if (!relayer) throw ScriptError("relayer not configured");

        SignedCall call{};
        call.trader = address_field(step, "trader");
        call.nonce = uint_field(step, "nonce");
        call.expiry = uint_field(step, "expiry");

        const std::string kind = field(step, "kind").get<std::string>();
        if (kind == "open_limit" || kind == "open_market") {
            call.kind = kind == "open_limit" ? CallKind::OPEN_LIMIT : CallKind::OPEN_MARKET;
            call.open = open_request(step);
        } else if (kind == "cancel") {
            call.kind = CallKind::CANCEL;
            call.trade_id = uint_field(step, "id");
        } else if (kind == "update_stops") {
            call.kind = CallKind::UPDATE_STOPS;
            call.trade_id = uint_field(step, "id");
            call.stop_loss = price_field(step, "stop_loss");
            call.take_profit = price_field(step, "take_profit");
        } else if (kind == "close_market") {
            call.kind = CallKind::CLOSE_MARKET;
            call.trade_id = uint_field(step, "id");
        } else {
            throw ScriptError("unknown relay kind '" + kind + "'");
        }
        if (call.kind == CallKind::OPEN_MARKET || call.kind == CallKind::CLOSE_MARKET) {
            call.proof = proof_field(step);
        }

        RelayResult r = relayer->dispatch(call);
        out["trade_id"] = r.trade_id;
        return r.status;
    }
};

//------------------------------------------------------------------------------
// Command Line
//------------------------------------------------------------------------------

void print_usage(const char* prog) {
    std::cout << "lever-replay - replay an operation script against a deployment\n\n"
              << "Usage: " << prog << " -c <config.json> -s <script.json> [options]\n\n"
              << "Options:\n"
              << "  -c, --config <file>   Deployment configuration\n"
              << "  -s, --script <file>   Script: {\"steps\": [{\"op\": ...}, ...]}\n"
              << "  -l, --log <level>     Log level (default: warn)\n"
              << "  --strict              Stop at the first failing step\n"
              << "  -h, --help            Show this help message\n";
}

Options parse_args(int argc, char* argv[]) {
    Options opts;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto value = [&](const char* what) -> std::string {
            if (i + 1 >= argc) {
                std::cerr << "Missing " << what << " argument\n";
                std::exit(2);
            }
            return argv[++i];
        };

        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            std::exit(0);
        } else if (arg == "-c" || arg == "--config") {
            opts.config_path = value("config");
        } else if (arg == "-s" || arg == "--script") {
            opts.script_path = value("script");
        } else if (arg == "-l" || arg == "--log") {
            opts.log_level = value("log level");
        } else if (arg == "--strict") {
            opts.strict = true;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            std::exit(2);
        }
    }

    if (opts.config_path.empty() || opts.script_path.empty()) {
        print_usage(argv[0]);
        std::exit(2);
    }
    return opts;
}

json load_script(const std::string& path) {
    std::ifstream in(path);
    if (!in) throw ScriptError("cannot open script '" + path + "'");
    std::stringstream buf;
    buf << in.rdbuf();

    json doc = json::parse(buf.str(), nullptr, false);
    if (doc.is_discarded() || !doc.is_object() || !doc.contains("steps") ||
        !doc["steps"].is_array()) {
        throw ScriptError("script must be an object with a 'steps' array");
    }
    return doc;
}

int main(int argc, char* argv[]) {
    Options opts = parse_args(argc, argv);
    log::set_level(opts.log_level);

    try {
        DeploymentConfig config = DeploymentConfig::from_file(opts.config_path);
        json script = load_script(opts.script_path);

        Lever lever(config, nullptr, std::make_unique<AcceptAllVerifier>());
        Replay replay(lever);

        int failures = 0;
        size_t index = 0;
        for (const auto& step : script["steps"]) {
            json out = {{"step", index++}};
            if (step.contains("op")) out["op"] = step["op"];

            int32_t status = replay.run(step, out);
            out["status"] = errors::to_string(status);
            std::cout << out.dump() << "\n";

            if (status != errors::OK) {
                ++failures;
                if (opts.strict) return 1;
            }
        }

        std::cerr << index << " steps, " << failures << " failed\n";
        return 0;
    } catch (const ConfigError& e) {
        std::cerr << "Configuration error: " << e.what() << "\n";
        return 2;
    } catch (const ScriptError& e) {
        std::cerr << "Script error: " << e.what() << "\n";
        return 2;
    } catch (const json::exception& e) {
        std::cerr << "Script error: " << e.what() << "\n";
        return 2;
    }
}
