#include <Locus/Locals/HashCodeAllocator.hpp>

namespace Locus::Locals
{
    namespace
    {
        // Constant-initialized and trivially destructible: usable from any static initializer.
        constinit HashCodeAllocator g_globalHashCodes {};
    }// namespace

    HashCodeAllocator& HashCodeAllocator::Global() noexcept
    {
        return g_globalHashCodes;
    }
}// namespace Locus::Locals
