#include "aoc23/day_07.hpp"

#include "aoc23/string.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <compare>
#include <cstddef>
#include <functional>
#include <string>
#include <string_view>
#include <tuple>
#include <vector>

namespace aoc23 {

  namespace {

    static constexpr size_t cards_per_hand = 5;

    /// Labels from weakest to strongest.
    static constexpr std::string_view card_labels = "23456789TJQKA";

    /// With jokers, 'J' moves to the front.
    static constexpr std::string_view joker_card_labels = "J23456789TQKA";

    static constexpr char joker = 'J';

    enum class hand_type_t : uint8_t {
      high_card,
      one_pair,
      two_pair,
      three_of_a_kind,
      full_house,
      four_of_a_kind,
      five_of_a_kind,
    };

    struct hand_t {
      hand_type_t type;
      std::array<uint8_t, cards_per_hand> strengths;
      uint32_t bid;

      std::string cards;

      /// Orders by type, then card by card from the left. The bid plays no part.
      auto operator<=>(hand_t const & other) const {
        return std::tie(type, strengths) <=> std::tie(other.type, other.strengths);
      }

      bool operator==(hand_t const & other) const {
        return (type == other.type) && (strengths == other.strengths);
      }
    };

    [[maybe_unused]] std::string format_as(hand_type_t type) {
      static constexpr auto names = std::to_array<std::string_view>({
          "high card", "one pair", "two pair", "three of a kind", "full house", "four of a kind",
          "five of a kind",
      });
      return std::string{names[static_cast<size_t>(type)]};
    }

    template <bool WithJokers>
    hand_type_t classify(std::string_view cards) {
      std::array<uint8_t, card_labels.size()> counts{};
      uint8_t num_jokers = 0;

      for (char const card : cards) {
        if (WithJokers && (card == joker)) {
          ++num_jokers;
        } else {
          ++counts[card_labels.find(card)];
        }
      }

      std::ranges::sort(counts, std::greater<>{});

      // Jokers always join the largest group. Five jokers are five of a kind.
      counts[0] += num_jokers;

      switch (counts[0]) {
        case 5:
          return hand_type_t::five_of_a_kind;
        case 4:
          return hand_type_t::four_of_a_kind;
        case 3:
          return (counts[1] == 2) ? hand_type_t::full_house : hand_type_t::three_of_a_kind;
        case 2:
          return (counts[1] == 2) ? hand_type_t::two_pair : hand_type_t::one_pair;
        default:
          return hand_type_t::high_card;
      }
    }

    template <bool WithJokers>
    hand_t parse_hand(std::string_view line) {
      static constexpr auto labels = WithJokers ? joker_card_labels : card_labels;

      try {
        auto const space = line.find(' ');
        if (space == line.npos) {
          throw parse_error("Expected '<cards> <bid>'");
        }

        auto const cards = line.substr(0, space);
        if (cards.size() != cards_per_hand) {
          throw parse_error(
              fmt::format("Expected {} cards, got {} ('{}')", cards_per_hand, cards.size(), cards));
        }

        hand_t hand{.type = {}, .strengths = {}, .bid = 0, .cards = std::string{cards}};
        for (size_t idx = 0; idx < cards.size(); ++idx) {
          auto const strength = labels.find(cards[idx]);
          if (strength == labels.npos) {
            throw parse_error(fmt::format("Invalid card '{}'", cards[idx]));
          }
          hand.strengths[idx] = static_cast<uint8_t>(strength);
        }

        hand.type = classify<WithJokers>(cards);
        hand.bid = to_int<uint32_t>(trim(line.substr(space + 1)));
        return hand;
      } catch (parse_error const & ex) {
        throw parse_error(fmt::format("In '{}': {}", line, ex.what()));
      }
    }

    template <bool WithJokers>
    uint64_t total_winnings(simd_string_view_t input) {
      std::vector<hand_t> hands;
      for (auto const line : split_lines(input)) {
        hands.push_back(parse_hand<WithJokers>(line));
      }

      std::ranges::sort(hands);

      // Identical hands are tied, and share a rank.
      uint64_t sum = 0;
      uint64_t rank = 0;
      for (size_t idx = 0; idx < hands.size(); ++idx) {
        if ((idx == 0) || (hands[idx] != hands[idx - 1])) {
          ++rank;
        }

        SPDLOG_TRACE("{} ({}): rank {}, bid {}", hands[idx].cards, format_as(hands[idx].type),
                     rank, hands[idx].bid);
        sum += rank * hands[idx].bid;
      }

      SPDLOG_DEBUG("Ranked {} hands into {} ranks", hands.size(), rank);
      return sum;
    }

  }  // namespace

  uint64_t day_t<7>::solve(part_t<1>, simd_string_view_t input) {
    return total_winnings<false>(input);
  }

  uint64_t day_t<7>::solve(part_t<2>, simd_string_view_t input) {
    return total_winnings<true>(input);
  }

}  // namespace aoc23
