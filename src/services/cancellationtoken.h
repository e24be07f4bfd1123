#ifndef CANCELLATIONTOKEN_H
#define CANCELLATIONTOKEN_H

#include <atomic>
#include <memory>

/**
 * @brief Shared cooperative cancellation flag.
 *
 * Copies share the same flag. The transfer queue keeps one copy and hands
 * another to the connector, which polls isCancelled() between chunks. The
 * flag is atomic because libcurl-backed connectors poll it from their worker
 * thread.
 */
class CancellationToken
{
public:
    CancellationToken()
        : flag_(std::make_shared<std::atomic_bool>(false))
    {
    }

    void cancel() { flag_->store(true); }

    [[nodiscard]] bool isCancelled() const { return flag_->load(); }

private:
    std::shared_ptr<std::atomic_bool> flag_;
};

#endif // CANCELLATIONTOKEN_H
