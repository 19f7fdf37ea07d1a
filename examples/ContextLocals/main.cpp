// main.cpp
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include <Locus/Locus.hpp>

using namespace Locus::Locals;

using StringContext = Context<std::string>;
using StringHandle  = Handle<std::string>;

namespace
{
    void PrintTable(const char* label, const StringContext::TableType* table)
    {
        if (!table)
        {
            std::cout << "  " << label << ": <no table>\n";
            return;
        }
        std::cout << "  " << label << ": size=" << table->Size() << " live=" << table->LiveCount()
                  << " capacity=" << table->Capacity() << "\n";
    }
}// namespace

int main()
{
    const auto requestId = StringHandle::WithInitial([] { return std::string("req-unassigned"); });
    const auto traceId   = StringHandle::Inheritable([](const std::string& parent) { return parent + "/child"; });
    const auto user      = StringHandle::Create();

    StringContext request;

    // --- Request-scoped values ---
    std::cout << "-- Request context --\n";
    std::cout << "  requestId (initial) = " << *request.Get(requestId) << "\n";
    request.Set(requestId, "req-42");
    request.Set(traceId, "trace-7f3a");
    request.Set(user, "alice");
    std::cout << "  requestId = " << *request.Get(requestId) << "\n";
    std::cout << "  traceId   = " << *request.Get(traceId) << "\n";
    std::cout << "  user      = " << *request.Get(user) << "\n";

    // --- Inheritance into a worker ---
    std::cout << "-- Spawned worker --\n";
    StringContext worker = StringContext::Spawn(request);
    std::thread   thread([ctx = std::move(worker), &traceId, &user, &requestId]() mutable {
        std::cout << "  traceId   = " << *ctx.Get(traceId) << "\n";
        std::cout << "  user      = " << (ctx.Find(user) ? *ctx.Find(user) : std::string("<not inherited>")) << "\n";
        std::cout << "  requestId = " << *ctx.Get(requestId) << "\n";
    });
    thread.join();

    // --- Stale entries ---
    std::cout << "-- Dropping handles --\n";
    {
        std::vector<StringHandle> scratch;
        for (int i = 0; i < 8; ++i)
        {
            scratch.push_back(StringHandle::Create());
            request.Set(scratch.back(), "scratch-" + std::to_string(i));
        }
        PrintTable("locals before", request.Locals());
    }
    PrintTable("locals after scope", request.Locals());

    // Any access probing through the run expunges what it meets; a full pass clears the rest.
    request.ExpungeStaleEntries();
    PrintTable("locals after expunge", request.Locals());

    const auto& stats = request.Locals()->GetStatistics();
    std::cout << "  expunged=" << stats.expungedEntries << " rehashes=" << stats.rehashes
              << " resizes=" << stats.resizes << "\n";
    return 0;
}
