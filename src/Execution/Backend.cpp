#include "Backend.h"

OwnedHandle::OwnedHandle(AcceleratedBackend &backend, BackendHandle handle)
    : backend_(&backend)
    , handle_(handle)
{
}

OwnedHandle::OwnedHandle(OwnedHandle &&rhs) noexcept
    : backend_(std::exchange(rhs.backend_, nullptr))
    , handle_(std::exchange(rhs.handle_, -1))
{
}

OwnedHandle &OwnedHandle::operator=(OwnedHandle &&rhs) noexcept
{
    if(this != &rhs)
    {
        OwnedHandle old{std::move(*this)};
        backend_ = std::exchange(rhs.backend_, nullptr);
        handle_ = std::exchange(rhs.handle_, -1);
    }
    return *this;
}

OwnedHandle::~OwnedHandle()
{
    if(!backend_)
        return;

    if(auto error = backend_->release(handle_))
        LOG("failed to release handle {} in backend {}: {}", handle_, backend_->name(), error->message);
}
