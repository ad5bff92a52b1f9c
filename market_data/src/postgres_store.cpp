#include "postgres_store.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>

namespace {

const char* kPriceColumns =
    "symbol, price_date::text, open::float8, high::float8, low::float8, close::float8, volume, "
    "currency, exchange_name, "
    "EXTRACT(EPOCH FROM created_at AT TIME ZONE 'UTC')::bigint, "
    "EXTRACT(EPOCH FROM updated_at AT TIME ZONE 'UTC')::bigint";

const char* kRateColumns =
    "from_currency, to_currency, rate::float8, "
    "EXTRACT(EPOCH FROM last_updated AT TIME ZONE 'UTC')::bigint";

template <typename T>
std::optional<T> nullable(const pqxx::field& field) {
    if (field.is_null()) return std::nullopt;
    return field.as<T>();
}

} // namespace

PostgresStore::PostgresStore(const std::string& dsn) : dsn_(dsn) {
    spdlog::info("PostgresStore initialized: {}", util::redact_dsn(dsn));
}

pqxx::connection PostgresStore::make_connection() {
    return pqxx::connection(dsn_);
}

void PostgresStore::init_schema() {
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);

        // Cached exchange rates, one row per ordered pair
        txn.exec(R"(
            CREATE TABLE IF NOT EXISTS exchange_rates (
                id BIGSERIAL PRIMARY KEY,
                from_currency CHAR(3) NOT NULL,
                to_currency CHAR(3) NOT NULL,
                rate NUMERIC(18,8) NOT NULL CHECK (rate > 0),
                last_updated TIMESTAMP NOT NULL,
                created_at TIMESTAMP NOT NULL DEFAULT (NOW() AT TIME ZONE 'UTC'),
                UNIQUE (from_currency, to_currency)
            )
        )");

        txn.exec(R"(
            CREATE INDEX IF NOT EXISTS ix_exchange_rates_last_updated
                ON exchange_rates (from_currency, to_currency, last_updated)
        )");

        // Daily security prices
        txn.exec(R"(
            CREATE TABLE IF NOT EXISTS security_prices (
                id BIGSERIAL PRIMARY KEY,
                symbol VARCHAR(20) NOT NULL,
                price_date DATE NOT NULL,
                open NUMERIC(15,4),
                high NUMERIC(15,4),
                low NUMERIC(15,4),
                close NUMERIC(15,4) NOT NULL,
                volume BIGINT,
                currency VARCHAR(3),
                exchange_name VARCHAR(10),
                created_at TIMESTAMP NOT NULL,
                updated_at TIMESTAMP NOT NULL,
                UNIQUE (symbol, price_date)
            )
        )");

        txn.exec(R"(
            CREATE INDEX IF NOT EXISTS ix_security_prices_symbol
                ON security_prices (symbol)
        )");

        txn.commit();
        spdlog::info("Database schema initialized");

    } catch (const std::exception& e) {
        spdlog::error("Failed to initialize schema: {}", e.what());
        throw;
    }
}

ExchangeRate PostgresStore::rate_from_row(const pqxx::row& row) {
    ExchangeRate rate;
    rate.from_currency = util::trim(row[0].as<std::string>());
    rate.to_currency = util::trim(row[1].as<std::string>());
    rate.rate = row[2].as<double>();
    rate.last_updated = util::from_unix_seconds(row[3].as<int64_t>());
    return rate;
}

SecurityPrice PostgresStore::price_from_row(const pqxx::row& row) {
    SecurityPrice price;
    price.symbol = row[0].as<std::string>();
    price.price_date = row[1].as<std::string>();
    price.open = nullable<double>(row[2]);
    price.high = nullable<double>(row[3]);
    price.low = nullable<double>(row[4]);
    price.close = row[5].as<double>();
    price.volume = nullable<int64_t>(row[6]);
    price.currency = nullable<std::string>(row[7]);
    price.exchange_name = nullable<std::string>(row[8]);
    price.created_at = util::from_unix_seconds(row[9].as<int64_t>());
    price.updated_at = util::from_unix_seconds(row[10].as<int64_t>());
    return price;
}

std::optional<ExchangeRate> PostgresStore::find_rate(const std::string& from, const std::string& to) {
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);

        auto result = txn.exec_params(
            std::string("SELECT ") + kRateColumns +
            " FROM exchange_rates WHERE from_currency = $1 AND to_currency = $2",
            from, to
        );

        txn.commit();

        if (result.empty()) {
            return std::nullopt;
        }
        return rate_from_row(result[0]);

    } catch (const std::exception& e) {
        spdlog::error("Failed to read rate {}{}: {}", from, to, e.what());
        throw;
    }
}

void PostgresStore::upsert_rate(const ExchangeRate& rate) {
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);

        txn.exec_params(
            "INSERT INTO exchange_rates (from_currency, to_currency, rate, last_updated) "
            "VALUES ($1, $2, $3, to_timestamp($4) AT TIME ZONE 'UTC') "
            "ON CONFLICT (from_currency, to_currency) DO UPDATE SET "
            "rate = EXCLUDED.rate, last_updated = EXCLUDED.last_updated",
            rate.from_currency, rate.to_currency, rate.rate,
            util::to_unix_seconds(rate.last_updated)
        );

        txn.commit();
        spdlog::debug("Upserted rate {} = {}", rate.pair_key(), rate.rate);

    } catch (const std::exception& e) {
        spdlog::error("Failed to upsert rate {}: {}", rate.pair_key(), e.what());
        throw;
    }
}

std::vector<ExchangeRate> PostgresStore::rates_updated_since(TimePoint since) {
    std::vector<ExchangeRate> rates;

    try {
        auto conn = make_connection();
        pqxx::work txn(conn);

        auto result = txn.exec_params(
            std::string("SELECT ") + kRateColumns +
            " FROM exchange_rates WHERE last_updated >= to_timestamp($1) AT TIME ZONE 'UTC' "
            "ORDER BY from_currency, to_currency",
            util::to_unix_seconds(since)
        );

        for (const auto& row : result) {
            rates.push_back(rate_from_row(row));
        }

        txn.commit();

    } catch (const std::exception& e) {
        spdlog::error("Failed to list current rates: {}", e.what());
        throw;
    }

    return rates;
}

std::optional<SecurityPrice> PostgresStore::find_price(const std::string& symbol, const std::string& date) {
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);

        auto result = txn.exec_params(
            std::string("SELECT ") + kPriceColumns +
            " FROM security_prices WHERE symbol = $1 AND price_date = $2::date",
            symbol, date
        );

        txn.commit();

        if (result.empty()) {
            return std::nullopt;
        }
        return price_from_row(result[0]);

    } catch (const std::exception& e) {
        spdlog::error("Failed to read price {} @ {}: {}", symbol, date, e.what());
        throw;
    }
}

std::optional<SecurityPrice> PostgresStore::latest_price(const std::string& symbol) {
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);

        auto result = txn.exec_params(
            std::string("SELECT ") + kPriceColumns +
            " FROM security_prices WHERE symbol = $1 "
            "ORDER BY price_date DESC, updated_at DESC LIMIT 1",
            symbol
        );

        txn.commit();

        if (result.empty()) {
            return std::nullopt;
        }
        return price_from_row(result[0]);

    } catch (const std::exception& e) {
        spdlog::error("Failed to read latest price for {}: {}", symbol, e.what());
        throw;
    }
}

std::vector<SecurityPrice> PostgresStore::prices_in_range(const std::string& symbol,
                                                          const std::string& start_date,
                                                          const std::string& end_date) {
    std::vector<SecurityPrice> prices;

    try {
        auto conn = make_connection();
        pqxx::work txn(conn);

        auto result = txn.exec_params(
            std::string("SELECT ") + kPriceColumns +
            " FROM security_prices "
            "WHERE symbol = $1 AND price_date >= $2::date AND price_date <= $3::date "
            "ORDER BY price_date",
            symbol, start_date, end_date
        );

        for (const auto& row : result) {
            prices.push_back(price_from_row(row));
        }

        txn.commit();

    } catch (const std::exception& e) {
        spdlog::error("Failed to read prices for {}: {}", symbol, e.what());
        throw;
    }

    return prices;
}

void PostgresStore::upsert_price(const SecurityPrice& price) {
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);

        txn.exec_params(
            "INSERT INTO security_prices "
            "(symbol, price_date, open, high, low, close, volume, currency, exchange_name, "
            "created_at, updated_at) "
            "VALUES ($1, $2::date, $3, $4, $5, $6, $7, $8, $9, "
            "to_timestamp($10) AT TIME ZONE 'UTC', to_timestamp($11) AT TIME ZONE 'UTC') "
            "ON CONFLICT (symbol, price_date) DO UPDATE SET "
            "open = EXCLUDED.open, high = EXCLUDED.high, low = EXCLUDED.low, "
            "close = EXCLUDED.close, volume = EXCLUDED.volume, "
            "currency = EXCLUDED.currency, exchange_name = EXCLUDED.exchange_name, "
            "updated_at = EXCLUDED.updated_at",
            price.symbol, price.price_date,
            price.open, price.high, price.low, price.close, price.volume,
            price.currency, price.exchange_name,
            util::to_unix_seconds(price.created_at),
            util::to_unix_seconds(price.updated_at)
        );

        txn.commit();

    } catch (const std::exception& e) {
        spdlog::error("Failed to upsert price {} @ {}: {}", price.symbol, price.price_date, e.what());
        throw;
    }
}

std::vector<std::string> PostgresStore::known_symbols() {
    std::vector<std::string> symbols;

    try {
        auto conn = make_connection();
        pqxx::work txn(conn);

        auto result = txn.exec("SELECT DISTINCT symbol FROM security_prices ORDER BY symbol");

        for (const auto& row : result) {
            symbols.push_back(row[0].as<std::string>());
        }

        txn.commit();

    } catch (const std::exception& e) {
        spdlog::error("Failed to list symbols: {}", e.what());
        throw;
    }

    return symbols;
}

size_t PostgresStore::delete_prices(const std::string& symbol, const std::optional<std::string>& date) {
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);

        pqxx::result result;
        if (date) {
            result = txn.exec_params(
                "DELETE FROM security_prices WHERE symbol = $1 AND price_date = $2::date",
                symbol, *date
            );
        } else {
            result = txn.exec_params("DELETE FROM security_prices WHERE symbol = $1", symbol);
        }

        txn.commit();

        auto deleted = static_cast<size_t>(result.affected_rows());
        spdlog::info("Deleted {} price rows for {}", deleted, symbol);
        return deleted;

    } catch (const std::exception& e) {
        spdlog::error("Failed to delete prices for {}: {}", symbol, e.what());
        throw;
    }
}

std::vector<Account> PostgresStore::accounts_for_user(int64_t user_id) {
    std::vector<Account> accounts;

    try {
        auto conn = make_connection();
        pqxx::work txn(conn);

        // Tables belong to the CRUD layer; read-only here
        auto result = txn.exec_params(
            R"(SELECT a."Id", a."Name", a."SortOrder",
                      i."Id", i."Name", i."Quantity"::float8, i."Value"::float8,
                      i."Currency", i."Category", i."Date"::date::text
               FROM "Accounts" a
               LEFT JOIN "Investments" i ON i."AccountId" = a."Id"
               WHERE a."UserId" = $1
               ORDER BY a."SortOrder", a."Name", a."Id", i."Id")",
            user_id
        );

        for (const auto& row : result) {
            auto account_id = row[0].as<int64_t>();
            if (accounts.empty() || accounts.back().id != account_id) {
                Account account;
                account.id = account_id;
                account.name = row[1].as<std::string>();
                account.sort_order = row[2].as<int>();
                accounts.push_back(account);
            }

            if (row[3].is_null()) {
                continue;   // account without investments
            }

            Holding h;
            h.id = row[3].as<int64_t>();
            h.account_id = account_id;
            h.name = row[4].as<std::string>();
            h.quantity = row[5].as<double>();
            h.purchase_value = row[6].as<double>();
            h.currency = util::to_upper(row[7].as<std::string>());
            h.purchase_date = row[9].as<std::string>();

            auto category = category_from_string(row[8].as<std::string>());
            if (!category) {
                spdlog::warn("Unknown category '{}' for investment {}", row[8].as<std::string>(), h.id);
                category = Category::ManagedPortfolio;
            }
            h.category = *category;

            accounts.back().holdings.push_back(h);
        }

        txn.commit();

    } catch (const std::exception& e) {
        spdlog::error("Failed to load accounts for user {}: {}", user_id, e.what());
        throw;
    }

    return accounts;
}

bool PostgresStore::ping() {
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);
        txn.exec("SELECT 1");
        txn.commit();
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Postgres ping failed: {}", e.what());
        return false;
    }
}
