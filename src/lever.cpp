// =============================================================================
// lever.cpp - Unified Controller
// =============================================================================

#include "lever/lever.hpp"
#include "lever/log.hpp"

namespace lever {

namespace {

void require_ok(int32_t status, const std::string& what) {
    if (status != errors::OK) {
        throw ConfigError(what + ": " + errors::to_string(status));
    }
}

} // anonymous namespace

Lever::Lever(const DeploymentConfig& config,
             std::unique_ptr<IPriceOracle> oracle,
             std::unique_ptr<ISignatureVerifier> verifier)
    : owner_(config.owner),
      access_(std::make_unique<AccessControl>(config.owner)),
      registry_(std::make_unique<AssetRegistry>()),
      oracle_(oracle ? std::move(oracle) : std::make_unique<JsonPriceOracle>()),
      ledger_(std::make_unique<CustodyLedger>(*access_, config.pool_mode, config.fee_skim_bps)),
      verifier_(std::move(verifier)) {

    require_ok(access_->grant(owner_, Role::LEDGER_CONTROLLER, config.engine_address),
               "grant ledger controller");
    for (const auto& keeper : config.keepers) {
        require_ok(access_->grant(owner_, Role::KEEPER, keeper), "grant keeper");
    }

    for (const auto& asset : config.assets) {
        require_ok(registry_->list_asset(asset), "list asset " + std::to_string(asset.id));
    }

    engine_ = std::make_unique<PositionEngine>(config.engine_address, *access_, *ledger_,
                                               *registry_, *oracle_, config.engine);

    if (verifier_) {
        require_ok(access_->grant(owner_, Role::RELAYER, config.relayer), "grant relayer");
        relayer_ = std::make_unique<Relayer>(config.relayer, *engine_, *verifier_);
    }

    log::logger()->info("lever {} up: {} assets, pool {}, {} keepers{}", version(),
                        config.assets.size(), to_string(config.pool_mode),
                        config.keepers.size(), relayer_ ? ", relayer enabled" : "");
}

Lever::~Lever() = default;

void Lever::set_clock(std::function<uint64_t()> clock) {
    if (relayer_) relayer_->set_clock(clock);
    engine_->set_clock(std::move(clock));
}

Lever::Stats Lever::stats() const {
    Stats s{};
    uint64_t next = engine_->next_trade_id();
    for (uint64_t id = 1; id < next; ++id) {
        auto state = engine_->state_of(id);
        if (!state) continue;
        ++s.trades;
        switch (*state) {
            case TradeState::ORDER: ++s.orders; break;
            case TradeState::OPEN: ++s.open_positions; break;
            case TradeState::CLOSED: ++s.closed; break;
            case TradeState::CANCELLED: ++s.cancelled; break;
        }
    }
    s.pool = ledger_->pool();
    s.total_value = ledger_->total_value();
    return s;
}

} // namespace lever
