#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <random>
#include <type_traits>

namespace methcomp
{
  namespace rng_utils
  {
    // Simple 64-bit splitmix hash (deterministic, good avalanche)
    inline uint64_t splitmix64(uint64_t x)
    {
      x += 0x9e3779b97f4a7c15ull;
      x = (x ^ (x >> 30)) * 0xbf58476d1ce4e5b9ull;
      x = (x ^ (x >> 27)) * 0x94d049bb133111ebull;
      return x ^ (x >> 31);
    }

    // Fold several 64-bit values into one seed
    inline uint64_t hash_combine64(std::initializer_list<uint64_t> parts)
    {
      uint64_t h = 0x6a09e667f3bcc909ull;
      for (auto v : parts)
	h = splitmix64(h ^ v);
      return h;
    }

    // Expand a 64-bit seed into eight 32-bit words of seed material
    inline std::seed_seq make_seed_seq(uint64_t seed64)
    {
      const uint64_t s0 = seed64;
      const uint64_t s1 = splitmix64(s0);
      const uint64_t s2 = splitmix64(s0 ^ 0x9e3779b97f4a7c15ull);
      const uint64_t s3 = splitmix64(s1 + 0xd1342543de82ef95ull);

      std::array<uint32_t, 8> words = {
	static_cast<uint32_t>(s0), static_cast<uint32_t>(s0 >> 32),
	static_cast<uint32_t>(s1), static_cast<uint32_t>(s1 >> 32),
	static_cast<uint32_t>(s2), static_cast<uint32_t>(s2 >> 32),
	static_cast<uint32_t>(s3), static_cast<uint32_t>(s3 >> 32)
      };

      return std::seed_seq(words.begin(), words.end());
    }

    template <class Eng>
    inline Eng construct_seeded_engine(std::seed_seq& sseq)
    {
      if constexpr (std::is_constructible_v<Eng, std::seed_seq&>)
	{
	  return Eng(sseq);
	}
      else
	{
	  Eng e;
	  e.seed(sseq);
	  return e;
	}
    }

    /**
     * @brief Uniform index in [0, hiExclusive).
     *
     * @pre hiExclusive > 0
     */
    template <class Eng>
    inline std::size_t get_random_index(Eng& engine, std::size_t hiExclusive)
    {
      std::uniform_int_distribution<std::size_t> dist(0, hiExclusive - 1);
      return dist(engine);
    }

    /**
     * @brief Deterministic engine per replicate.
     *
     * The engine for replicate b depends only on (master seed, b), so a
     * resampling loop produces the same draws whichever thread runs which
     * replicate.
     */
    template <class Eng = std::mt19937_64>
    class ReplicateEngineProvider
    {
    public:
      using Engine = Eng;

      explicit ReplicateEngineProvider(uint64_t masterSeed)
	: m_masterSeed(masterSeed)
      {}

      uint64_t make_seed_for(std::size_t replicate) const
      {
	return hash_combine64({m_masterSeed, static_cast<uint64_t>(replicate)});
      }

      Engine make_engine(std::size_t replicate) const
      {
	auto sseq = make_seed_seq(make_seed_for(replicate));
	return construct_seeded_engine<Engine>(sseq);
      }

      uint64_t masterSeed() const noexcept
      {
	return m_masterSeed;
      }

    private:
      uint64_t m_masterSeed;
    };
  } // namespace rng_utils
} // namespace methcomp
