// cpamm - Basic Example
// Walks a pool through genesis deposit, a second provider, a rejected
// off-ratio deposit and a full drain.

#include <cpamm/pool.hpp>
#include <cpamm/config.hpp>
#include <cpamm/log.hpp>
#include <spdlog/spdlog.h>
#include <exception>
#include <iostream>

using namespace cpamm;

namespace {

void print_pool(const LiquidityManager& pool) {
    PoolDetails d = pool.pool_details();
    std::cout << "Pool: token1=" << to_string(d.total_token1)
              << " token2=" << to_string(d.total_token2)
              << " shares=" << to_string(d.total_shares)
              << " fee_bps=" << to_string(d.fee_basis_points) << "\n";
}

void print_holdings(const char* name, const LiquidityManager& pool, const Address& who) {
    Holdings h = pool.holdings_of(who);
    std::cout << name << ": token1=" << to_string(h.token1)
              << " token2=" << to_string(h.token2)
              << " shares=" << to_string(h.shares) << "\n";
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        PoolConfig config = argc > 1 ? PoolConfig::from_file(argv[1])
                                     : PoolConfig().with_fee(30);
        setup_logging(config.log_level);

        LiquidityManager pool(config);
        LoggingHooks logging_hooks;
        pool.register_hooks(&logging_hooks);

        const Address alice = address_from_id(1);
        const Address bob = address_from_id(2);

        if (pool.faucet(alice, 1000, 1000) != errors::OK ||
            pool.faucet(bob, 1000, 1000) != errors::OK) {
            spdlog::error("faucet failed");
            return 1;
        }

        AmountResult genesis = pool.provide(alice, 100, 100);
        std::cout << "Alice minted " << to_string(genesis.amount) << " shares\n";

        AmountResult quote = pool.equivalent_token2_for(50);
        if (quote.ok()) {
            std::cout << "50 token1 pairs with " << to_string(quote.amount) << " token2\n";
        }

        AmountResult second = pool.provide(bob, 50, quote.amount);
        std::cout << "Bob minted " << to_string(second.amount) << " shares\n";

        AmountResult skewed = pool.provide(bob, 50, 60);
        std::cout << "Off-ratio deposit: " << error_string(skewed.status) << "\n";

        print_pool(pool);

        WithdrawResult a = pool.withdraw(alice, pool.holdings_of(alice).shares);
        WithdrawResult b = pool.withdraw(bob, pool.holdings_of(bob).shares);
        if (!a.ok() || !b.ok()) {
            spdlog::error("withdraw failed: {} / {}", error_string(a.status), error_string(b.status));
            return 1;
        }

        print_holdings("Alice", pool, alice);
        print_holdings("Bob", pool, bob);
        print_pool(pool);

        WithdrawResult after = pool.withdraw_estimate(1);
        std::cout << "Estimate on drained pool: " << error_string(after.status) << "\n";

        auto stats = pool.get_stats();
        spdlog::info("accounts={} provides={} withdrawals={} rejected={}",
                     stats.total_accounts, stats.total_provides,
                     stats.total_withdrawals, stats.rejected_ops);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
