#include "test_helpers.hpp"

int main()
{
    bchain::limits_t limits;
    assert(limits.get(bchain::limit_option::max_prefix_length)
           == BCHAIN_DEFAULT_MAX_PREFIX_LENGTH);
    assert(limits.get(bchain::limit_option::max_part_length) == -1);
    assert(limits.get(bchain::limit_option::max_part_count) == -1);
    assert(limits.get(bchain::limit_option::max_chain_size) == -1);

    limits.set(bchain::limit_option::max_part_length, 4)
      .set(bchain::limit_option::max_part_count, 2);
    assert(limits.handle()->max_part_length == 4);
    assert(limits.handle()->max_part_count == 2);

    // encoder honours the limits
    std::vector<std::string> strings;
    strings.push_back("abcd");
    strings.push_back("e");
    std::vector<unsigned char> out;
    assert(bchain::encode("x", to_parts(strings), out, limits) == 0);

    strings.push_back("f");
    assert(bchain::encode("x", to_parts(strings), out, limits) == -1);
    assert(bchain::last_error().code() == EBCHAINPARTCOUNT);

    // decoder honours the limits given at construction
    bchain::stream_decoder_t decoder(limits);
    assert(decoder.valid());
    int64_t value = 0;
    assert(decoder.get(bchain::limit_option::max_part_length, &value) == 0);
    assert(value == 4);

    const std::vector<unsigned char> wire = bchain::encode("x", to_parts(strings));
    std::vector<bchain::event_t> events;
    assert(decoder.feed(&wire[0], wire.size(), events) == -1);
    assert(bchain_errno() == EBCHAINPARTCOUNT);
    assert(!events.empty());
    assert(events.back().type == bchain::event_type::error);
    assert(events.back().error == EBCHAINPARTCOUNT);
    assert(!decoder.idle());

    // limits change between chains, not inside one
    bchain::stream_decoder_t other;
    assert(other.set(bchain::limit_option::max_chain_size, 100) == 0);
    assert(other.get(bchain::limit_option::max_chain_size, &value) == 0);
    assert(value == 100);
    other.feed(std::string("pre"));
    assert(other.set(bchain::limit_option::max_chain_size, 10) == -1);
    assert(bchain_errno() == EBUSY);

    // an invalid limit set fails the construction
    bchain::limits_t bad;
    bad.set(bchain::limit_option::max_prefix_length, -1);
    bchain::stream_decoder_t broken(bad);
    assert(!broken.valid());

    return 0;
}
