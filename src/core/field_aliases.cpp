/**
 * @file field_aliases.cpp
 * @brief Таблица полных названий месторождений
 */

#include "field_aliases.hpp"

namespace wellboard::core {

const std::map<std::string, std::string>& defaultFieldAliases() {
    static const std::map<std::string, std::string> kAliases = {
        {"12 MILE WASH", "TWELVE MILE WASH FIELD"},
        {"8 MILE FLAT NORTH", "EIGHT MILE FLAT NORTH FIELD"},
        {"AAGARD RANCH", "AAGARD RANCH FIELD"},
        {"AGENCY DRAW", "AGENCY DRAW FIELD"},
        {"AGENCY DRAW WEST", "AGENCY DRAW WEST FIELD"},
        {"AKAH", "AKAH FIELD"},
        {"ALGER PASS", "ALGER PASS FIELD"},
        {"ALKALI CANYON", "ALKALI CANYON FIELD"},
        {"ALKALI POINT", "ALKALI POINT FIELD"},
        {"ALTAMONT", "ALTAMONT FIELD"},
        {"ANDERSON JUNCTION", "ANDERSON JUNCTION FIELD"},
        {"ANETH", "ANETH FIELD"},
        {"ANIDO CREEK", "ANIDO CREEK FIELD"},
        {"ANSCHUTZ RANCH", "ANSCHUTZ RANCH FIELD"},
        {"ANSCHUTZ RANCH EAST", "ANSCHUTZ RANCH EAST FIELD"},
        {"ANSCHUTZ RANCH WEBER", "ANSCHUTZ RANCH (WEBER) FIELD"},
        {"ANTELOPE CREEK", "ANTELOPE CREEK FIELD"},
        {"ASHLEY VALLEY", "ASHLEY VALLEY FIELD"},
        {"ASPHALT WASH", "ASPHALT WASH FIELD"},
        {"ATCHEE RIDGE", "ATCHEE RIDGE FIELD"},
        {"BANNOCK", "BANNOCK FIELD"},
        {"BAR X", "BAR X FIELD"},
        {"BIG FLAT", "BIG FLAT FIELD"},
        {"BIG FLAT WEST", "BIG FLAT WEST FIELD"},
        {"BIG INDIAN NORTH", "BIG INDIAN (NORTH) FIELD"},
        {"BIG INDIAN SOUTH", "BIG INDIAN (SOUTH) FIELD"},
        {"BIG SPRING", "BIG SPRING FIELD"},
        {"BIG VALLEY", "BIG VALLEY FIELD"},
        {"BITTER CREEK", "BITTER CREEK FIELD"},
        {"BLACK BULL", "BLACK BULL FIELD"},
        {"BLACK HORSE CYN", "BLACK HORSE CANYON FIELD"},
        {"BLAZE CANYON", "BLAZE CANYON FIELD"},
        {"BLUEBELL", "BLUEBELL FIELD"},
        {"BLUFF", "BLUFF FIELD"},
        {"BLUFF BENCH", "BLUFF BENCH FIELD"},
        {"BONANZA", "BONANZA FIELD"},
        {"BOOK CLIFFS", "BOOK CLIFFS FIELD"},
        {"BOUNDARY BUTTE", "BOUNDARY BUTTE FIELD"},
        {"BRADFORD CYN", "BRADFORD CANYON FIELD"},
        {"BRENNAN BOTTOM", "BRENNAN BOTTOM FIELD"},
        {"BRIDGELAND", "BRIDGELAND FIELD"},
        {"BRIDGER LAKE", "BRIDGER LAKE FIELD"},
        {"BROKEN HILLS", "BROKEN HILLS FIELD"},
        {"BRONCO", "BRONCO FIELD"},
        {"BRUNDAGE CANYON", "BRUNDAGE CANYON FIELD"},
        {"BRYSON CANYON", "BRYSON CANYON FIELD"},
        {"BUCK CANYON", "BUCK CANYON FIELD"},
        {"BUG", "BUG FIELD"},
        {"BUSHY", "BUSHY FIELD"},
        {"BUZZARD BENCH", "BUZZARD BENCH FIELD"},
        {"CABALLO", "CABALLO FIELD"},
        {"CACTUS PARK", "CACTUS PARK FIELD"},
        {"CAJON LAKE", "CAJON LAKE FIELD"},
        {"CAJON MESA", "CAJON MESA FIELD"},
        {"CANE CREEK", "KANE CREEK FIELD"},
        {"CASA MESA", "CASA MESA FIELD"},
        {"CASTLEGATE", "CASTLEGATE FIELD"},
        {"CAVE CANYON", "CAVE CANYON FIELD"},
        {"CAVE CREEK", "CAVE CREEK FIELD"},
        {"CEDAR CAMP", "CEDAR CAMP FIELD"},
        {"CEDAR RIM", "CEDAR RIM FIELD"},
        {"CHALK CREEK GAS STORAGE", "CHALK CREEK GAS STORAGE"},
        {"CHEROKEE", "CHEROKEE FIELD"},
        {"CHINLE WASH", "CHINLE WASH FIELD"},
        {"CHOKECHERRY CYN", "CHOKECHERRY CANYON FIELD"},
        {"CISCO DOME", "CISCO DOME FIELD"},
        {"CLAY BASIN", "CLAY BASIN FIELD"},
        {"CLAY HILL", "CLAY HILL FIELD"},
        {"CLEAR CREEK", "CLEAR CREEK FIELD"},
        {"CLEFT", "CLEFT FIELD"},
        {"COALVILLE GAS STORAGE", "COALVILLE GAS STORAGE"},
        {"CONE ROCK", "CONE ROCK FIELD"},
        {"COTTONWOOD WASH", "COTTONWOOD WASH FIELD"},
        {"COVENANT", "COVENANT FIELD"},
        {"COWBOY", "COWBOY FIELD"},
        {"COYOTE BASIN", "COYOTE BASIN FIELD"},
        {"CROOKED CANYON", "CROOKED CANYON FIELD"},
        {"DARK CANYON", "DARK CANYON FIELD"},
        {"DAVIS CANYON", "DAVIS CANYON FIELD"},
        {"DEAD MAN CANYON", "DEADMAN CANYON FIELD"},
        {"DEADMAN-ISMY", "DEADMAN (ISMAY) FIELD"},
        {"DELTA SALT CAVERN STORAGE", "DELTA SALT CAVERN STORAGE FIELD"},
        {"DESERT CREEK", "DESERT CREEK FIELD"},
        {"DEVILS PLAYGROUND", "DEVIL'S PLAYGROUND FIELD"},
        {"DIAMOND RIDGE", "DIAMOND RIDGE FIELD"},
        {"DRUNKARDS WASH", "DRUNKARDS WASH FIELD"},
        {"DRY BURN", "DRY BURN FIELD"},
        {"DUCHESNE", "DUCHESNE FIELD"},
        {"EAST CANYON", "EAST CANYON FIELD"},
        {"EIGHT MILE FLAT", "EIGHT MILE FLAT FIELD"},
        {"ELKHORN", "ELKHORN FIELD"},
        {"EVACUATION CREEK", "EVACUATION CREEK FIELD"},
        {"FARMINGTON", "FARMINGTON FIELD"},
        {"FARNHAM DOME", "FARNHAM DOME FIELD"},
        {"FENCE CANYON", "FENCE CANYON FIELD"},
        {"FERRON", "FERRON FIELD"},
        {"FIRTH", "FIRTH FIELD"},
        {"FLAT CANYON", "FLAT CANYON FIELD"},
        {"FLAT ROCK", "FLAT ROCK FIELD"},
        {"GATE CANYON", "GATE CANYON FIELD"},
        {"GORDON CREEK", "GORDON CREEK FIELD"},
        {"GOTHIC MESA", "GOTHIC MESA FIELD"},
        {"GRASSY TRAIL", "GRASSY TRAIL FIELD"},
        {"GRAYSON", "GRAYSON FIELD"},
        {"GREATER ANETH", "GREATER ANETH FIELD"},
        {"GREATER CISCO", "GREATER CISCO FIELD"},
        {"GREENTOWN", "GREENTOWN FIELD"},
        {"GUSHER", "GUSHER FIELD"},
        {"GYPSUM HILLS", "GYPSUM HILLS FIELD"},
        {"HALFWAY HOLLOW", "HALFWAY HOLLOW FIELD"},
        {"HATCH", "HATCH FIELD"},
        {"HATCH POINT", "HATCH POINT FIELD"},
        {"HELL ROARING", "HELL ROARING FIELD"},
        {"HELL'S HOLE", "HELL'S HOLE FIELD"},
        {"HELPER", "HELPER FIELD"},
        {"HERON", "HERON FIELD"},
        {"HILL CREEK", "HILL CREEK FIELD"},
        {"HOGAN", "HOGAN FIELD"},
        {"HOGBACK RIDGE", "HOGBACK RIDGE FIELD"},
        {"HORSE CANYON", "HORSE CANYON FIELD"},
        {"HORSE POINT", "HORSE POINT FIELD"},
        {"HORSEHEAD POINT", "HORSEHEAD POINT FIELD"},
        {"HORSESHOE BEND", "HORSESHOE BEND FIELD"},
        {"ICE CANYON (DK-MR)", "ICE CANYON FIELD"},
        {"INDEPENDENCE", "INDEPENDENCE FIELD"},
        {"INDIAN CANYON", "INDIAN CANYON FIELD"},
        {"ISMAY", "ISMAY FIELD"},
        {"JOE'S VALLEY", "JOE'S VALLEY FIELD"},
        {"KACHINA", "KACHINA FIELD"},
        {"KENNEDY WASH", "KENNEDY WASH FIELD"},
        {"KICKER", "KICKER FIELD"},
        {"KIVA", "KIVA FIELD"},
        {"LAKE CANYON", "LAKE CANYON FIELD"},
        {"LAST CHANCE", "LAST CHANCE FIELD"},
        {"LEFT HAND CYN", "LEFT HAND CANYON FIELD"},
        {"LELAND BENCH", "LELAND BENCH FIELD"},
        {"LIGHTNING DRAW", "LIGHTNING DRAW FIELD"},
        {"LIGHTNING DRAW SE", "LIGHTNING DRAW FIELD"},
        {"LION MESA", "LION MESA FIELD"},
        {"LISBON", "LISBON FIELD"},
        {"LITTLE NANCY", "LITTLE NANCY FIELD"},
        {"LITTLE VALLEY", "LITTLE VALLEY FIELD"},
        {"LODGEPOLE", "LODGEPOLE FIELD"},
        {"LONE SPRING", "LONE SPRING FIELD"},
        {"LONG CANYON", "LONG CANYON FIELD"},
        {"LOVE", "LOVE FIELD"},
        {"MAIN CANYON", "MAIN CANYON FIELD"},
        {"MANCOS FLAT", "MANCOS FLAT FIELD"},
        {"MATHEWS", "MATHEWS FIELD"},
        {"MC CRACKEN SPRING", "MCCRACKEN SPRING FIELD"},
        {"MCELMO MESA", "MCELMO MESA FIELD"},
        {"MEXICAN HAT", "MEXICAN HAT FIELD"},
        {"MIDDLE BENCH", "MIDDLE BENCH FIELD"},
        {"MIDDLE CANYON (DKTA)", "MIDDLE CANYON FIELD"},
        {"MILLER CREEK", "MILLER CREEK FIELD"},
        {"MOAB GAS STORAGE", "MOAB GAS STORAGE"},
        {"MOFFAT CANAL", "MOFFAT CANAL FIELD"},
        {"MONUMENT", "MONUMENT FIELD"},
        {"MONUMENT BUTTE", "MONUMENT BUTTE FIELD"},
        {"MOON RIDGE", "MOON RIDGE FIELD"},
        {"MUSTANG FLAT", "MUSTANG FLAT FIELD"},
        {"NATURAL BUTTES", "NATURAL BUTTES FIELD"},
        {"NAVAJO CANYON", "NAVAJO CANYON FIELD"},
        {"NAVAL RESERVE", "NAVAL RESERVE FIELD"},
        {"NINE MILE CANYON", "NINE MILE CANYON FIELD"},
        {"NORTH BONANZA", "NORTH BONANZA FIELD"},
        {"NORTH MYTON BENCH", "NORTH MYTON BENCH"},
        {"NORTH PINEVIEW", "NORTH PINEVIEW FIELD"},
        {"OIL SPRINGS", "OIL SPRINGS FIELD"},
        {"PAIUTE KNOLL", "PAIUTE KNOLL FIELD"},
        {"PARIETTE BENCH", "PARIETTE BENCH FIELD"},
        {"PARK ROAD", "PARK ROAD FIELD"},
        {"PATTERSON CANYON", "PATTERSON CANYON FIELD"},
        {"PEAR PARK", "PEAR PARK FIELD"},
        {"PETERS POINT", "PETERS POINT FIELD"},
        {"PETERSON SPRING", "PETERSON SPRINGS FIELD"},
        {"PETES WASH", "PETES WASH FIELD"},
        {"PINE SPRINGS", "PINE SPRINGS FIELD"},
        {"PINEVIEW", "PINEVIEW FIELD"},
        {"PLEASANT VALLEY", "PLEASANT VALLEY FIELD"},
        {"POWDER SPRINGS", "POWDER SPRINGS FIELD"},
        {"PROVIDENCE", "PROVIDENCE FIELD"},
        {"RABBIT EARS", "RABBIT EARS FIELD"},
        {"RANDLETT", "RANDLETT FIELD"},
        {"RAT HOLE CANYON", "RAT HOLE CANYON FIELD"},
        {"RECAPTURE CREEK", "RECAPTURE CREEK FIELD"},
        {"RECAPTURE POCKET", "RECAPTURE POCKET FIELD"},
        {"RED WASH", "RED WASH FIELD"},
        {"RIVER BANK", "RIVER BANK FIELD"},
        {"ROAD CANYON", "ROAD CANYON FIELD"},
        {"ROBIDOUX", "ROBIDOUX FIELD"},
        {"ROCK HOUSE", "ROCK HOUSE FIELD"},
        {"ROCKWELL FLAT", "ROCKWELL FLAT FIELD"},
        {"ROZEL POINT", "ROZEL POINT FIELD"},
        {"RUNWAY", "RUNWAY FIELD"},
        {"SALT WASH", "SALT WASH FIELD"},
        {"SAN ARROYO", "SAN ARROYO FIELD"},
        {"SCOFIELD", "UCOLO FIELD"},
        {"SEEP RIDGE", "SEEP RIDGE FIELD"},
        {"SEEP RIDGE B (DKTA)", "SEEP RIDGE B FIELD"},
        {"SEGUNDO CANYON", "SEGUNDO CANYON FIELD"},
        {"SHAFER CANYON", "SHAFER CANYON FIELD"},
        {"SHUMWAY POINT", "SHUMWAY POINT FIELD"},
        {"SODA SPRING", "SODA SPRING FIELD"},
        {"SOLDIER CREEK", "SOLDIER CREEK FIELD"},
        {"SOUTH CANYON", "SOUTH CANYON FIELD"},
        {"SOUTH ISMAY", "SOUTH ISMAY FIELD"},
        {"SOUTH MYTON BENCH", "NORTH MYTON BENCH"},
        {"SOUTH PINE RIDGE", "SOUTH PINE RIDGE FIELD"},
        {"SOWERS CANYON", "SOWER CANYON FIELD"},
        {"SQUAW CANYON", "SQUAW CANYON FIELD"},
        {"SQUAW POINT", "SQUAW POINT FIELD"},
        {"STARR FLAT", "STARR FLAT FIELD"},
        {"STATELINE", "STATE LINE FIELD"},
        {"STONE CABIN", "STONE CABIN FIELD"},
        {"STRAWBERRY", "STRAWBERRY FIELD"},
        {"SWEET WATER RIDGE", "SWEETWATER RIDGE FIELD"},
        {"SWEETWATER CYN", "SWEETWATER CANYON FIELD"},
        {"TABYAGO", "TABYAGO CANYON FIELD"},
        {"TEN MILE", "TEN MILE FIELD"},
        {"THREE RIVERS", "THREE RIVERS FIELD"},
        {"TIN CUP MESA", "TIN CUP MESA FIELD"},
        {"TOHONADLA", "TOHONADLA FIELD"},
        {"TOWER", "TOWER FIELD"},
        {"TURNER BLUFF", "TURNER BLUFF FIELD"},
        {"UCOLO", "UCOLO FIELD"},
        {"UPPER VALLEY", "UPPER VALLEY FIELD"},
        {"UTELAND BUTTE", "UTELAND BUTTE FIELD"},
        {"VIRGIN", "VIRGIN FIELD"},
        {"WALKER HOLLOW", "WALKER HOLLOW FIELD"},
        {"WEST WILLOW CREEK", "WEST WILLOW CREEK FIELD"},
        {"WESTWATER", "WESTWATER FIELD"},
        {"WHISKEY CREEK", "WHISKEY CREEK FIELD"},
        {"WHITE MESA", "WHITE MESA FIELD"},
        {"WHITE RIVER", "WHITE RIVER FIELD"},
        {"WHITEBELLY WASH", "WHITEBELLY WASH FIELD"},
        {"WILD STALLION", "WILD STALLION FIELD"},
        {"WILSON CANYON", "WILSON CANYON FIELD"},
        {"WINDY RIDGE", "WINDY RIDGE FIELD"},
        {"WINTER CAMP", "WINTER CAMP FIELD"},
        {"WOLF POINT", "WOLF POINT FIELD"},
        {"WONSITS VALLEY", "WONSITS VALLEY FIELD"},
        {"WOODSIDE", "WOODSIDE FIELD"},
        {"YELLOW ROCK", "YELLOW ROCK FIELD"},
    };
    return kAliases;
}

} // namespace wellboard::core
