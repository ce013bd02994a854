#include <atomic>
#include <cassert>
#include <chrono>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "peerdrop/server/code_generator.hpp"
#include "peerdrop/server/coordinator.hpp"
#include "peerdrop/server/session_store.hpp"

using namespace peerdrop;
using namespace peerdrop::server;

namespace
{

    struct FakeClock
    {
        Timestamp now{std::chrono::system_clock::time_point{std::chrono::seconds{1700000000}}};

        Clock clock()
        {
            return [this]
            { return now; };
        }
    };

    // Reports every code as taken.
    class SaturatedStore : public InMemorySessionStore
    {
    public:
        bool contains_code(const std::string & /*code*/) const override { return true; }
    };

    Session seeded_session(const std::string &code, Timestamp created_at)
    {
        Session session;
        session.session_id = "session_seeded";
        session.code = code;
        session.created_at = created_at;
        return session;
    }

    void test_code_alphabet()
    {
        assert(CodeGenerator::is_valid_code("X7K2P9"));
        assert(!CodeGenerator::is_valid_code("x7k2p9"));
        assert(!CodeGenerator::is_valid_code("X7K2P"));
        assert(!CodeGenerator::is_valid_code("X7K2P9Q"));
        assert(!CodeGenerator::is_valid_code("X7-2P9"));
    }

    void test_create_session_unique_codes()
    {
        FakeClock time;
        Coordinator coordinator(std::make_unique<InMemorySessionStore>(), {}, time.clock());

        std::set<std::string> codes;
        std::set<std::string> ids;
        for (int i = 0; i < 1000; ++i)
        {
            const auto ticket = coordinator.create_session();
            assert(CodeGenerator::is_valid_code(ticket.code));
            codes.insert(ticket.code);
            ids.insert(ticket.session_id);
        }
        assert(codes.size() == 1000);
        assert(ids.size() == 1000);
        assert(coordinator.session_count() == 1000);
    }

    void test_code_space_exhaustion()
    {
        FakeClock time;
        Coordinator coordinator(std::make_unique<SaturatedStore>(), CoordinatorConfig{.max_code_attempts = 5},
                                time.clock());
        bool threw = false;
        try
        {
            (void)coordinator.create_session();
        }
        catch (const CodeSpaceExhausted &)
        {
            threw = true;
        }
        assert(threw);
        assert(coordinator.session_count() == 0);
    }

    void test_two_peers_lock_session()
    {
        FakeClock time;
        auto store = std::make_unique<InMemorySessionStore>();
        store->put(seeded_session("X7K2P9", time.now));
        Coordinator coordinator(std::move(store), {}, time.clock());

        const auto first = coordinator.register_peer("X7K2P9", "peer_a");
        assert(first);
        auto info = coordinator.get_session_info("X7K2P9");
        assert(info && info->peer_count == 1 && !info->is_locked);

        const auto second = coordinator.register_peer("X7K2P9", "peer_b");
        assert(second);
        assert(second.value() == first.value());

        info = coordinator.get_session_info("X7K2P9");
        assert(info);
        assert(info->session_id == "session_seeded");
        assert(info->peer_count == 2);
        assert(info->is_locked);
        assert(!info->is_expired);

        const auto third = coordinator.register_peer("X7K2P9", "peer_c");
        assert(!third);
        assert(third.error() == ErrorCode::Full);

        const auto again = coordinator.register_peer("X7K2P9", "peer_a");
        assert(again);
        assert(again.value() == first.value());
        assert(coordinator.get_session_info("X7K2P9")->peer_count == 2);

        const auto unknown = coordinator.register_peer("AAAAAA", "peer_a");
        assert(unknown.error() == ErrorCode::NotFound);
    }

    void test_signals_reach_only_the_other_peer()
    {
        FakeClock time;
        Coordinator coordinator(std::make_unique<InMemorySessionStore>(), {}, time.clock());
        const auto ticket = coordinator.create_session();
        assert(coordinator.register_peer(ticket.code, "peer_a"));

        assert(coordinator.send_signal(ticket.session_id, "peer_a", "early").code == ErrorCode::NoPeer);

        assert(coordinator.register_peer(ticket.code, "peer_b"));
        assert(coordinator.send_signal(ticket.session_id, "peer_a", "offer-1").ok());
        assert(coordinator.send_signal(ticket.session_id, "peer_a", "candidate-1").ok());
        assert(coordinator.send_signal(ticket.session_id, "peer_b", "answer-1").ok());

        const auto for_b = coordinator.poll_signals(ticket.session_id, "peer_b");
        assert(for_b);
        assert((for_b.value() == std::vector<std::string>{"offer-1", "candidate-1"}));

        const auto for_a = coordinator.poll_signals(ticket.session_id, "peer_a");
        assert(for_a);
        assert((for_a.value() == std::vector<std::string>{"answer-1"}));

        assert(coordinator.send_signal(ticket.session_id, "peer_x", "spoof").code == ErrorCode::PeerNotRegistered);
        assert(coordinator.poll_signals(ticket.session_id, "peer_x").error() == ErrorCode::PeerNotRegistered);
        assert(coordinator.send_signal("session_missing", "peer_a", "x").code == ErrorCode::NotFound);
    }

    void test_poll_is_pure_until_cleared()
    {
        FakeClock time;
        Coordinator coordinator(std::make_unique<InMemorySessionStore>(), {}, time.clock());
        const auto ticket = coordinator.create_session();
        assert(coordinator.register_peer(ticket.code, "peer_a"));
        assert(coordinator.register_peer(ticket.code, "peer_b"));
        assert(coordinator.send_signal(ticket.session_id, "peer_a", "one").ok());
        assert(coordinator.send_signal(ticket.session_id, "peer_a", "two").ok());

        const auto first = coordinator.poll_signals(ticket.session_id, "peer_b").value();
        const auto second = coordinator.poll_signals(ticket.session_id, "peer_b").value();
        assert(first == second);
        assert(first.size() == 2);

        assert(coordinator.clear_signals(ticket.session_id, "peer_b").ok());
        assert(coordinator.poll_signals(ticket.session_id, "peer_b").value().empty());
        assert(coordinator.clear_signals(ticket.session_id, "peer_b").ok());

        assert(coordinator.send_signal(ticket.session_id, "peer_a", "three").ok());
        assert((coordinator.poll_signals(ticket.session_id, "peer_b").value() == std::vector<std::string>{"three"}));
    }

    void test_expired_sessions()
    {
        FakeClock time;
        Coordinator coordinator(std::make_unique<InMemorySessionStore>(),
                                CoordinatorConfig{.session_ttl = std::chrono::seconds(600)}, time.clock());
        const auto ticket = coordinator.create_session();
        assert(coordinator.register_peer(ticket.code, "peer_a"));
        assert(coordinator.register_peer(ticket.code, "peer_b"));

        time.now += std::chrono::seconds(600);
        assert(!coordinator.get_session_info(ticket.code)->is_expired);

        time.now += std::chrono::seconds(1);
        // Queries see the expired session without removing it.
        const auto info = coordinator.get_session_info(ticket.code);
        assert(info && info->is_expired);
        assert(coordinator.poll_signals(ticket.session_id, "peer_a").error() == ErrorCode::Expired);
        assert(coordinator.session_count() == 1);

        assert(coordinator.send_signal(ticket.session_id, "peer_a", "late").code == ErrorCode::Expired);
        assert(coordinator.session_count() == 0);
        assert(!coordinator.get_session_info(ticket.code));
        assert(coordinator.register_peer(ticket.code, "peer_a").error() == ErrorCode::NotFound);
    }

    void test_registration_on_expired_code()
    {
        FakeClock time;
        Coordinator coordinator(std::make_unique<InMemorySessionStore>(), {}, time.clock());
        const auto ticket = coordinator.create_session();
        const auto fresh = coordinator.create_session();

        time.now += coordinator.config().session_ttl + std::chrono::seconds(1);
        const auto late = coordinator.register_peer(ticket.code, "peer_a");
        assert(late.error() == ErrorCode::Expired);
        assert(!coordinator.get_session_info(fresh.code));
        assert(coordinator.sweep_expired() == 0);
    }

    void test_sweep_keeps_live_sessions()
    {
        FakeClock time;
        Coordinator coordinator(std::make_unique<InMemorySessionStore>(), {}, time.clock());
        (void)coordinator.create_session();
        time.now += std::chrono::seconds(400);
        const auto young = coordinator.create_session();
        time.now += std::chrono::seconds(300);

        assert(coordinator.sweep_expired() == 1);
        assert(coordinator.session_count() == 1);
        assert(coordinator.get_session_info(young.code));
    }

    void test_concurrent_signals_queue_per_peer()
    {
        constexpr int kSignals = 200;
        Coordinator coordinator(std::make_unique<InMemorySessionStore>());
        const auto ticket = coordinator.create_session();
        assert(coordinator.register_peer(ticket.code, "peer_a"));
        assert(coordinator.register_peer(ticket.code, "peer_b"));

        std::atomic<int> failures{0};
        auto flood = [&](const std::string &from)
        {
            for (int i = 0; i < kSignals; ++i)
            {
                if (!coordinator.send_signal(ticket.session_id, from, from + "-" + std::to_string(i)).ok())
                {
                    ++failures;
                }
            }
        };
        std::thread from_a(flood, std::string("peer_a"));
        std::thread from_b(flood, std::string("peer_b"));
        from_a.join();
        from_b.join();
        assert(failures == 0);

        const auto to_b = coordinator.poll_signals(ticket.session_id, "peer_b");
        const auto to_a = coordinator.poll_signals(ticket.session_id, "peer_a");
        assert(to_a && to_b);
        assert(to_a.value().size() == kSignals);
        assert(to_b.value().size() == kSignals);
        for (int i = 0; i < kSignals; ++i)
        {
            assert(to_b.value()[i] == "peer_a-" + std::to_string(i));
            assert(to_a.value()[i] == "peer_b-" + std::to_string(i));
        }
    }

    void test_concurrent_registration_stays_consistent()
    {
        constexpr int kContenders = 8;
        Coordinator coordinator(std::make_unique<InMemorySessionStore>());
        const auto ticket = coordinator.create_session();

        std::mutex results_mutex;
        std::vector<std::string> joined;
        int refused = 0;
        std::vector<std::thread> contenders;
        for (int i = 0; i < kContenders; ++i)
        {
            contenders.emplace_back([&, i]
                                    {
                const auto peer_id = "peer_" + std::to_string(i);
                const auto result = coordinator.register_peer(ticket.code, peer_id);
                std::lock_guard lock(results_mutex);
                if (result)
                {
                    assert(result.value() == ticket.session_id);
                    joined.push_back(peer_id);
                }
                else
                {
                    assert(result.error() == ErrorCode::Full);
                    ++refused;
                } });
        }
        for (auto &thread : contenders)
        {
            thread.join();
        }

        assert(joined.size() == 2);
        assert(refused == kContenders - 2);
        const auto info = coordinator.get_session_info(ticket.code);
        assert(info && info->session_id == ticket.session_id);
        assert(info->peer_count == 2 && info->is_locked);
        for (const auto &peer_id : joined)
        {
            assert(coordinator.poll_signals(ticket.session_id, peer_id));
        }
        assert(coordinator.send_signal(ticket.session_id, joined[0], "hello").ok());
        assert(coordinator.poll_signals(ticket.session_id, joined[1]).value().size() == 1);
    }

    void test_concurrent_creation_indexes_both_ways()
    {
        constexpr int kThreads = 4;
        constexpr int kPerThread = 100;
        Coordinator coordinator(std::make_unique<InMemorySessionStore>());

        std::mutex tickets_mutex;
        std::vector<SessionTicket> tickets;
        std::vector<std::thread> creators;
        for (int t = 0; t < kThreads; ++t)
        {
            creators.emplace_back([&]
                                  {
                for (int i = 0; i < kPerThread; ++i)
                {
                    auto ticket = coordinator.create_session();
                    std::lock_guard lock(tickets_mutex);
                    tickets.push_back(std::move(ticket));
                } });
        }
        for (auto &thread : creators)
        {
            thread.join();
        }

        std::set<std::string> codes;
        for (const auto &ticket : tickets)
        {
            codes.insert(ticket.code);
            const auto info = coordinator.get_session_info(ticket.code);
            assert(info && info->session_id == ticket.session_id);
        }
        assert(codes.size() == kThreads * kPerThread);
        assert(coordinator.session_count() == kThreads * kPerThread);
    }

} // namespace

void run_server_component_tests()
{
    test_code_alphabet();
    test_create_session_unique_codes();
    test_code_space_exhaustion();
    test_two_peers_lock_session();
    test_signals_reach_only_the_other_peer();
    test_poll_is_pure_until_cleared();
    test_expired_sessions();
    test_registration_on_expired_code();
    test_sweep_keeps_live_sessions();
    test_concurrent_signals_queue_per_peer();
    test_concurrent_registration_stays_consistent();
    test_concurrent_creation_indexes_both_ways();
}
