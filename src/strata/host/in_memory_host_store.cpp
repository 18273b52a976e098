#include <strata/core/byte_string.hpp>
#include <strata/host/in_memory_host_store.hpp>

#include <optional>

STRATA_NAMESPACE_BEGIN

std::optional<byte_string>
InMemoryHostStore::read(byte_string_view const key) const
{
    auto const it = data_.find(key);
    if (it == data_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void InMemoryHostStore::write(
    byte_string_view const key, byte_string_view const value)
{
    ++writes_;
    data_.insert_or_assign(byte_string{key}, byte_string{value});
}

void InMemoryHostStore::remove(byte_string_view const key)
{
    ++writes_;
    if (auto const it = data_.find(key); it != data_.end()) {
        data_.erase(it);
    }
}

STRATA_NAMESPACE_END
