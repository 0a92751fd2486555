#include "test_helpers.hpp"

#include <utility>

int main()
{
    std::vector<std::string> strings;
    strings.push_back("first");
    strings.push_back("");
    strings.push_back(std::string(1000, 'x'));

    std::vector<unsigned char> stream = bchain::encode("hdr", to_parts(strings));
    const std::vector<unsigned char> second =
      bchain::encode("", std::vector<bchain::part_t>(1, to_part("2")));
    stream.insert(stream.end(), second.begin(), second.end());

    bchain::stream_decoder_t whole;
    const std::string expected = describe(feed_in_chunks(whole, stream, stream.size()));
    assert(expected.find("prefix hdr\npart 0 first\npart 1 \npart 2 xxx") == 0);
    assert(expected.find("chain hdr 3 [first] [] [xxx") != std::string::npos);
    const std::string tail = "prefix \npart 0 2\nchain  1 [2]\n";
    assert(expected.size() > tail.size());
    assert(expected.compare(expected.size() - tail.size(), tail.size(), tail) == 0);
    assert(whole.idle());

    // chunking does not change the events
    const size_t chunks[] = {1, 2, 3, 17, 512};
    for (size_t i = 0; i < sizeof(chunks) / sizeof(chunks[0]); ++i) {
        bchain::stream_decoder_t decoder;
        assert(describe(feed_in_chunks(decoder, stream, chunks[i])) == expected);
        assert(decoder.finish() == 0);
    }

    // truncated stream
    bchain::stream_decoder_t truncated;
    truncated.feed(&stream[0], 10);
    assert(!truncated.idle());
    assert(truncated.finish() == -1);
    assert(bchain_errno() == EBCHAINEOS);

    // invalid marker, then nothing more is accepted
    bchain::stream_decoder_t broken;
    const std::vector<bchain::event_t> events = broken.feed(std::string("ab\x90"));
    assert(events.size() == 1);
    assert(events[0].type == bchain::event_type::error);
    assert(events[0].error == EBCHAINMARKER);

    std::vector<bchain::event_t> later;
    const unsigned char eoc = 0xff;
    assert(broken.feed(&eoc, 1, later) == -1);
    assert(later.size() == 1);
    assert(later[0].error == EBCHAINMARKER);

    // move-only ownership of the handle
    bchain::stream_decoder_t moved(std::move(whole));
    assert(!whole.valid());
    assert(moved.valid());
    bchain::stream_decoder_t target;
    target = std::move(moved);
    assert(!moved.valid());
    assert(target.valid());
    assert(target.close() == 0);
    assert(!target.valid());

    return 0;
}
