/**
 * @file cancellationtoken.h
 * @brief Cooperative cancellation shared between a transfer and its session.
 */

#ifndef CANCELLATIONTOKEN_H
#define CANCELLATIONTOKEN_H

#include <atomic>
#include <memory>

/**
 * @brief Read-only view of a cancellation request.
 *
 * Tokens are cheap to copy. A default-constructed token is never cancelled.
 * Session implementations poll isCancellationRequested() between chunks.
 */
class CancellationToken
{
public:
    CancellationToken() = default;

    [[nodiscard]] bool isCancellationRequested() const;

private:
    friend class CancellationSource;

    enum class State { Armed, Cancelled, Disposed };

    struct SharedState {
        std::atomic<State> state{State::Armed};
        std::atomic<bool> cancelRequested{false};
    };

    explicit CancellationToken(std::shared_ptr<const SharedState> state)
        : state_(std::move(state))
    {
    }

    std::shared_ptr<const SharedState> state_;
};

/**
 * @brief Owner side of a cancellation request.
 *
 * A source moves Armed -> Cancelled -> Disposed or Armed -> Disposed.
 * Every transition is a compare-and-swap, so a late cancel() racing with
 * dispose() is a no-op instead of an error.
 */
class CancellationSource
{
public:
    CancellationSource();

    /**
     * @brief Requests cancellation.
     * @return True if this call moved the source from Armed to Cancelled.
     */
    bool cancel();

    /**
     * @brief Retires the source once the transfer has settled.
     *
     * Tokens handed out earlier keep reporting the last cancellation request.
     */
    void dispose();

    [[nodiscard]] bool isCancellationRequested() const;
    [[nodiscard]] bool isDisposed() const;

    [[nodiscard]] CancellationToken token() const;

private:
    using State = CancellationToken::State;

    std::shared_ptr<CancellationToken::SharedState> state_;
};

#endif // CANCELLATIONTOKEN_H
