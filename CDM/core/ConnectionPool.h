#pragma once
#include <queue>
#include <memory>
#include <mutex>
#include <functional>

#include "../net/HttpClient.h"

// Keeps idle transports (curl handles) for reuse across chunk attempts.
class ConnectionPool {
public:
    using Factory = std::function<std::unique_ptr<Transport>()>;

    ConnectionPool(Factory factory, std::size_t maxSize);

    std::unique_ptr<Transport> acquire();
    void release(std::unique_ptr<Transport> client);

    std::size_t idle() const;

private:
    Factory makeTransport;
    std::size_t maxPoolSize;
    std::queue<std::unique_ptr<Transport>> pool;
    mutable std::mutex mtx;
};

// RAII lease: returns the transport to its pool on scope exit.
class PooledConnection {
public:
    explicit PooledConnection(ConnectionPool& pool)
        : owner(pool), client(pool.acquire()) {
    }
    ~PooledConnection() {
        owner.release(std::move(client));
    }

    PooledConnection(const PooledConnection&) = delete;
    PooledConnection& operator=(const PooledConnection&) = delete;

    Transport* operator->() const { return client.get(); }
    Transport& operator*() const { return *client; }
    explicit operator bool() const { return client != nullptr; }

private:
    ConnectionPool& owner;
    std::unique_ptr<Transport> client;
};
