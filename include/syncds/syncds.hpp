// syncds.hpp
// Umbrella header for the syncds concurrent containers.
//
//   CoarseSet<T>        sorted list, one mutex
//   FineGrainedSet<T>   sorted list, per-node mutexes, lock coupling
//   CoarseMap<K,V>      hash table, one mutex
//   StripedMap<K,V>     hash table, fixed bank of striped mutexes
//
// Every container is non-copyable and shared between threads through the
// std::shared_ptr returned by its make() factory.
//
//   Build:  header-only, C++17, link with -pthread

#ifndef SYNCDS_SYNCDS_HPP
#define SYNCDS_SYNCDS_HPP

#include "coarse_map.hpp"
#include "coarse_set.hpp"
#include "fine_grained_set.hpp"
#include "map_config.hpp"
#include "striped_map.hpp"

#endif // SYNCDS_SYNCDS_HPP
