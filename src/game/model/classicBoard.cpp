#include "model/classicBoard.hpp"

namespace monopoly {

static SpaceData special(SpaceIndex index, SpaceKind kind, const char* name) {
	return SpaceData{.index = index, .kind = kind, .name = name};
}

static SpaceData property(SpaceIndex index, const char* name, Money price, std::vector<Money> rent, Money houseCost, ColorGroup group) {
	return SpaceData{
	        .index         = index,
	        .kind          = SpaceKind::Property,
	        .name          = name,
	        .price         = price,
	        .rent          = std::move(rent),
	        .houseCost     = houseCost,
	        .mortgageValue = price / 2,
	        .group         = group,
	};
}

static SpaceData railroad(SpaceIndex index, const char* name) {
	return SpaceData{
	        .index         = index,
	        .kind          = SpaceKind::Railroad,
	        .name          = name,
	        .price         = 200,
	        .rent          = {25, 50, 100, 200},
	        .mortgageValue = 100,
	        .group         = ColorGroup::Railroad,
	};
}

static SpaceData utility(SpaceIndex index, const char* name) {
	return SpaceData{
	        .index         = index,
	        .kind          = SpaceKind::Utility,
	        .name          = name,
	        .price         = 150,
	        .mortgageValue = 75,
	        .group         = ColorGroup::Utility,
	};
}

Board classicBoard() {
	using enum ColorGroup;

	return Board({
	        special(0u, SpaceKind::Go, "GO"),
	        property(1u, "Mediterranean Avenue", 60, {2, 10, 30, 90, 160, 250}, 50, Brown),
	        special(2u, SpaceKind::CommunityChest, "Community Chest"),
	        property(3u, "Baltic Avenue", 60, {4, 20, 60, 180, 320, 450}, 50, Brown),
	        special(4u, SpaceKind::IncomeTax, "Income Tax"),
	        railroad(5u, "Reading Railroad"),
	        property(6u, "Oriental Avenue", 100, {6, 30, 90, 270, 400, 550}, 50, LightBlue),
	        special(7u, SpaceKind::Chance, "Chance"),
	        property(8u, "Vermont Avenue", 100, {6, 30, 90, 270, 400, 550}, 50, LightBlue),
	        property(9u, "Connecticut Avenue", 120, {8, 40, 100, 300, 450, 600}, 50, LightBlue),
	        special(10u, SpaceKind::Jail, "Jail"),
	        property(11u, "St. Charles Place", 140, {10, 50, 150, 450, 625, 750}, 100, Pink),
	        utility(12u, "Electric Company"),
	        property(13u, "States Avenue", 140, {10, 50, 150, 450, 625, 750}, 100, Pink),
	        property(14u, "Virginia Avenue", 160, {12, 60, 180, 500, 700, 900}, 100, Pink),
	        railroad(15u, "Pennsylvania Railroad"),
	        property(16u, "St. James Place", 180, {14, 70, 200, 550, 750, 950}, 100, Orange),
	        special(17u, SpaceKind::CommunityChest, "Community Chest"),
	        property(18u, "Tennessee Avenue", 180, {14, 70, 200, 550, 750, 950}, 100, Orange),
	        property(19u, "New York Avenue", 200, {16, 80, 220, 600, 800, 1000}, 100, Orange),
	        special(20u, SpaceKind::FreeParking, "Free Parking"),
	        property(21u, "Kentucky Avenue", 220, {18, 90, 250, 700, 875, 1050}, 150, Red),
	        special(22u, SpaceKind::Chance, "Chance"),
	        property(23u, "Indiana Avenue", 220, {18, 90, 250, 700, 875, 1050}, 150, Red),
	        property(24u, "Illinois Avenue", 240, {20, 100, 300, 750, 925, 1100}, 150, Red),
	        railroad(25u, "B. & O. Railroad"),
	        property(26u, "Atlantic Avenue", 260, {22, 110, 330, 800, 975, 1150}, 150, Yellow),
	        property(27u, "Ventnor Avenue", 260, {22, 110, 330, 800, 975, 1150}, 150, Yellow),
	        utility(28u, "Water Works"),
	        property(29u, "Marvin Gardens", 280, {24, 120, 360, 850, 1025, 1200}, 150, Yellow),
	        special(30u, SpaceKind::GoToJail, "Go To Jail"),
	        property(31u, "Pacific Avenue", 300, {26, 130, 390, 900, 1100, 1275}, 200, Green),
	        property(32u, "North Carolina Avenue", 300, {26, 130, 390, 900, 1100, 1275}, 200, Green),
	        special(33u, SpaceKind::CommunityChest, "Community Chest"),
	        property(34u, "Pennsylvania Avenue", 320, {28, 150, 450, 1000, 1200, 1400}, 200, Green),
	        railroad(35u, "Short Line"),
	        special(36u, SpaceKind::Chance, "Chance"),
	        property(37u, "Park Place", 350, {35, 175, 500, 1100, 1300, 1500}, 200, DarkBlue),
	        special(38u, SpaceKind::LuxuryTax, "Luxury Tax"),
	        property(39u, "Boardwalk", 400, {50, 200, 600, 1400, 1700, 2000}, 200, DarkBlue),
	});
}

std::vector<Card> chanceCards() {
	return {
	        {"ch_boardwalk", "Advance to Boardwalk.", AdvanceAction{39u, false}},
	        {"ch_go", "Advance to Go (Collect $200).", AdvanceAction{0u, true}},
	        {"ch_illinois", "Advance to Illinois Avenue.", AdvanceAction{24u, true}},
	        {"ch_st_charles", "Advance to St. Charles Place.", AdvanceAction{11u, true}},
	        {"ch_near_rr", "Advance to the nearest Railroad. Pay the owner twice the rental.", AdvanceNearestAction{SpaceKind::Railroad, 2u}},
	        {"ch_near_rr_b", "Advance to the nearest Railroad. Pay the owner twice the rental.", AdvanceNearestAction{SpaceKind::Railroad, 2u}},
	        {"ch_near_util", "Advance to nearest Utility.", AdvanceNearestAction{SpaceKind::Utility, 1u}},
	        {"ch_dividend", "Bank pays you dividend of $50.", MoneyAction{50}},
	        {"ch_getout", "Get Out of Jail Free.", JailFreeAction{}},
	        {"ch_back_3", "Go Back 3 Spaces.", AdvanceRelativeAction{-3}},
	        {"ch_go_to_jail", "Go to Jail. Do not pass Go.", GoToJailAction{}},
	        {"ch_repairs", "For each house pay $25. For each hotel pay $100.", RepairsAction{25, 100}},
	        {"ch_speeding", "Speeding fine $15.", MoneyAction{-15}},
	        {"ch_reading", "Advance to Reading Railroad.", AdvanceAction{5u, true}},
	        {"ch_chairman", "Pay each player $50.", PayEachPlayerAction{50}},
	        {"ch_loan", "Collect $150.", MoneyAction{150}},
	};
}

std::vector<Card> communityChestCards() {
	return {
	        {"cc_collect_100", "You set aside time to hang out with your neighbor. COLLECT $100.", MoneyAction{100}},
	        {"cc_collect_50", "You clean up your town's footpaths. COLLECT $50.", MoneyAction{50}},
	        {"cc_collect_10", "You volunteered at a blood donation. COLLECT $10.", MoneyAction{10}},
	        {"cc_pay_50", "You buy cookies from a school bake sale. PAY $50.", MoneyAction{-50}},
	        {"cc_getout", "GET OUT OF JAIL FREE.", JailFreeAction{}},
	        {"cc_collect_10e", "You organize a street party. COLLECT $10 FROM EACH.", CollectFromEachAction{10}},
	        {"cc_go_to_jail", "GO TO JAIL. DO NOT PASS GO.", GoToJailAction{}},
	        {"cc_collect_20", "You help your neighbor. COLLECT $20.", MoneyAction{20}},
	        {"cc_collect_100b", "You help build a playground. COLLECT $100.", MoneyAction{100}},
	        {"cc_collect_100c", "You play games with kids at hospital. COLLECT $100.", MoneyAction{100}},
	        {"cc_pay_100", "Car wash fundraiser. PAY $100.", MoneyAction{-100}},
	        {"cc_advance_go", "ADVANCE TO GO. (COLLECT $200)", AdvanceAction{0u, true}},
	        {"cc_collect_200", "You help clean up after a storm. COLLECT $200.", MoneyAction{200}},
	        {"cc_pay_50b", "Donation to animal shelter. PAY $50.", MoneyAction{-50}},
	        {"cc_repairs", "For each house pay $40. For each hotel pay $115.", RepairsAction{40, 115}},
	        {"cc_collect_25", "You organize a bake sale. COLLECT $25.", MoneyAction{25}},
	};
}

} // namespace monopoly
