#pragma once
#include <memory>

namespace ecsuite::utils
{

template <typename T, void (*f)(T*)> struct StaticFunctionDeleter
{
    void operator()(T* t) const noexcept
    {
        f(t);
    }
};

} // namespace ecsuite::utils

/// Declares @p alias as a unique pointer to @p object released by @p deleter.
/// The alias converts implicitly to the raw pointer so it can be passed to OpenSSL directly.
#define ECSUITE_DEFINE_UNIQUE_PTR_WITH_DELETER(alias, object, deleter)                                                 \
    struct alias : public std::unique_ptr<object, deleter>                                                             \
    {                                                                                                                  \
        using unique_ptr::unique_ptr;                                                                                  \
                                                                                                                       \
        operator object*() const                                                                                       \
        {                                                                                                              \
            return this->get();                                                                                        \
        }                                                                                                              \
    }

#define ECSUITE_DEFINE_UNIQUE_PTR(alias, object, freeFunction)                                                         \
    using alias##Deleter = ::ecsuite::utils::StaticFunctionDeleter<object, &freeFunction>;                             \
    ECSUITE_DEFINE_UNIQUE_PTR_WITH_DELETER(alias, object, alias##Deleter)
