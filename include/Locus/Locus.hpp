#pragma once
#include <Locus/Defines.hpp>
#include <Locus/Exceptions/Exception.hpp>
#include <Locus/Exceptions/InvariantViolationException.hpp>
#include <Locus/Exceptions/NotSupportedException.hpp>
#include <Locus/Locals/Config.hpp>
#include <Locus/Locals/Context.hpp>
#include <Locus/Locals/Handle.hpp>
#include <Locus/Locals/HashCodeAllocator.hpp>
#include <Locus/Locals/InheritanceCopier.hpp>
#include <Locus/Locals/OwnerTable.hpp>
#include <Locus/Memory/AllocatorConcept.hpp>
#include <Locus/Memory/AllocatorRef.hpp>
#include <Locus/Memory/SmartPointers.hpp>
#include <Locus/Memory/SystemAllocator.hpp>
#include <Locus/Memory/TrackingAllocator.hpp>
#include <Locus/Primitives.hpp>
