#ifndef TEST_HANDS_HPP
#define TEST_HANDS_HPP

#include <string>

// Tournament hand that ends on the flop without a showdown
inline const std::string FlopHand =
R"(Full Tilt Poker Game #33286946295: MiniFTOPS Main Event (255707037), Table 179 - NL Hold'em - 10/20 - 19:26:50 CET - 2013/09/22 [13:26:50 ET - 2013/09/22]
Seat 1: Popp1987 (13,587)
Seat 2: Luckytobgood (10,110)
Seat 3: FatalRevange (9,970)
Seat 4: IgaziFerfi (10,000)
Seat 5: egis25 (6,873)
Seat 6: gamblie (9,880)
Seat 7: idanuTz1 (10,180)
Seat 8: PtheProphet (9,930)
Seat 9: JohnyyR (9,840)
gamblie posts the small blind of 10
idanuTz1 posts the big blind of 20
The button is in seat #5
*** HOLE CARDS ***
Dealt to IgaziFerfi [9d Ks]
PtheProphet folds
JohnyyR folds
Popp1987 folds
Luckytobgood folds
FatalRevange raises to 60
IgaziFerfi folds
egis25 folds
gamblie folds
idanuTz1 calls 40
*** FLOP *** [8h 4h Tc] (Total Pot: 130, 2 Players)
idanuTz1 checks
FatalRevange bets 80
idanuTz1 folds
Uncalled bet of 80 returned to FatalRevange
FatalRevange mucks
FatalRevange wins the pot (130)
*** SUMMARY ***
Total pot 130 | Rake 0
Board: [8h 4h Tc]
Seat 1: Popp1987 didn't bet (folded)
Seat 2: Luckytobgood didn't bet (folded)
Seat 3: FatalRevange collected (130), mucked
Seat 4: IgaziFerfi didn't bet (folded)
Seat 5: egis25 (button) didn't bet (folded)
Seat 6: gamblie (small blind) folded before the Flop
Seat 7: idanuTz1 (big blind) folded on the Flop
Seat 8: PtheProphet didn't bet (folded)
Seat 9: JohnyyR didn't bet (folded)
)";

// Sit & Go hand played to the river with a showdown
inline const std::string ShowdownHand =
R"(Full Tilt Poker Game #26523853401: $10 Sit & Go (241934875), Table 1 - NL Hold'em - 15/30 - 14:05:12 ET - 2010/12/05 [14:05:12 ET - 2010/12/05]
Seat 1: alpha (1,500)
Seat 2: bravo (1,470)
Seat 3: charlie (1,530)
alpha posts the small blind of 15
bravo posts the big blind of 30
The button is in seat #3
*** HOLE CARDS ***
Dealt to charlie [Ah Ad]
charlie raises to 90
alpha folds
bravo calls 60
*** FLOP *** [Js 7s 2s] (Total Pot: 195, 2 Players)
bravo checks
charlie bets 120
bravo calls 120
*** TURN *** [Js 7s 2s] [7d] (Total Pot: 435, 2 Players)
bravo checks
charlie checks
*** RIVER *** [Js 7s 2s 7d] [3c] (Total Pot: 435, 2 Players)
bravo checks
charlie checks
*** SHOW DOWN ***
bravo shows [Kc Qc] a pair of Sevens
charlie shows [Ah Ad] two pair, Aces and Sevens
charlie wins the pot (435) with two pair, Aces and Sevens
*** SUMMARY ***
Total pot 435 | Rake 0
Board: [Js 7s 2s 7d 3c]
Seat 1: alpha (small blind) folded before the Flop
Seat 2: bravo (big blind) showed [Kc Qc] and lost with a pair of Sevens
Seat 3: charlie (button) showed [Ah Ad] and won (435) with two pair, Aces and Sevens
)";

// Hand decided before the flop, the summary has no board line
inline const std::string PreflopHand =
R"(Full Tilt Poker Game #33286946296: MiniFTOPS Main Event (255707037), Table 179 - NL Hold'em - 10/20 - 19:28:02 CET - 2013/09/22 [13:28:02 ET - 2013/09/22]
Seat 1: Popp1987 (13,587)
Seat 2: Luckytobgood (10,110)
Seat 3: FatalRevange (10,100)
Seat 4: IgaziFerfi (10,000)
Popp1987 posts the small blind of 10
Luckytobgood posts the big blind of 20
The button is in seat #4
*** HOLE CARDS ***
Dealt to IgaziFerfi [2c 7d]
FatalRevange raises to 60
IgaziFerfi folds
Popp1987 folds
Luckytobgood folds
Uncalled bet of 40 returned to FatalRevange
FatalRevange mucks
FatalRevange wins the pot (60)
*** SUMMARY ***
Total pot 60 | Rake 0
Seat 1: Popp1987 (small blind) folded before the Flop
Seat 2: Luckytobgood (big blind) folded before the Flop
Seat 3: FatalRevange collected (60), mucked
Seat 4: IgaziFerfi (button) didn't bet (folded)
)";

#endif // TEST_HANDS_HPP
