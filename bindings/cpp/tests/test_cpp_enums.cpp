#include <bchain.hpp>

#include <cassert>
#include <string>

int main()
{
    // event_type values
    assert(static_cast<int>(bchain::event_type::prefix) == BCHAIN_EVENT_PREFIX);
    assert(static_cast<int>(bchain::event_type::part) == BCHAIN_EVENT_PART);
    assert(static_cast<int>(bchain::event_type::chain) == BCHAIN_EVENT_CHAIN);
    assert(static_cast<int>(bchain::event_type::error) == BCHAIN_EVENT_ERROR);

    // limit_option values
    assert(static_cast<int>(bchain::limit_option::max_prefix_length)
           == BCHAIN_MAX_PREFIX_LENGTH);
    assert(static_cast<int>(bchain::limit_option::max_part_length)
           == BCHAIN_MAX_PART_LENGTH);
    assert(static_cast<int>(bchain::limit_option::max_part_count)
           == BCHAIN_MAX_PART_COUNT);
    assert(static_cast<int>(bchain::limit_option::max_chain_size)
           == BCHAIN_MAX_CHAIN_SIZE);

    // error_t
    bchain::error_t err(EBCHAINMARKER);
    assert(err.code() == EBCHAINMARKER);
    assert(std::string(err.what()) == bchain_strerror(EBCHAINMARKER));

    int major = 0, minor = 0, patch = 0;
    bchain::version(&major, &minor, &patch);
    assert(major == BCHAIN_VERSION_MAJOR);
    assert(minor == BCHAIN_VERSION_MINOR);
    assert(patch == BCHAIN_VERSION_PATCH);

    return 0;
}
