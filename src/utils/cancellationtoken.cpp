#include "cancellationtoken.h"

bool CancellationToken::isCancellationRequested() const
{
    return state_ && state_->cancelRequested.load(std::memory_order_acquire);
}

CancellationSource::CancellationSource()
    : state_(std::make_shared<CancellationToken::SharedState>())
{
}

bool CancellationSource::cancel()
{
    State expected = State::Armed;
    if (!state_->state.compare_exchange_strong(expected, State::Cancelled,
                                               std::memory_order_acq_rel)) {
        // Already cancelled or disposed
        return false;
    }
    state_->cancelRequested.store(true, std::memory_order_release);
    return true;
}

void CancellationSource::dispose()
{
    state_->state.store(State::Disposed, std::memory_order_release);
}

bool CancellationSource::isCancellationRequested() const
{
    return state_->cancelRequested.load(std::memory_order_acquire);
}

bool CancellationSource::isDisposed() const
{
    return state_->state.load(std::memory_order_acquire) == State::Disposed;
}

CancellationToken CancellationSource::token() const
{
    return CancellationToken(state_);
}
