/**
 * @file AnnotationConfig.cpp
 * @brief Default code tables and derived configuration values
 */

#include "survey_annotator.hpp"
#include <cmath>

namespace survey {

int AnnotationConfig::effective_tin_scale() const {
    if (tin.scale.has_value()) {
        return std::max(*tin.scale, 1);
    }
    return std::max(static_cast<int>(std::lround(effective_scale_factor() * 1000.0)), 1);
}

std::vector<BlockMappingEntry> AnnotationConfig::default_block_mapping() {
    // Entry order is lookup order: the first entry listing a code wins
    return {
        {"Moln", "109a", {"moln", "молн"}},
        {"Fonar", "110", {"fonar", "фонар"}},
        {"TrZn", "206-1", {"trzn", "трзн", "gazzn", "укнефть", "уккм"}},
        {"KIP", "129-1", {"kip", "skip", "kik", "кик", "кип"}},
        {"Аншлаг", "аншлаг", {"аншлаг", "anshlag"}},
        {"Est", "107-1", {"est", "st est", "st est aroch", "мтэст"}},
        {"KabZNM", "206-3", {"kabznm", "кабзнм", "укмет"}},
        {"KabZNB", "119", {"kabznb", "кабзнб"}},
        {"Zadv", "26l", {"zadv", "zad", "задв", "зад"}},
        {"Rodnik", "311", {"родник", "rodnik", "rod"}},
        {"Svecha", "091-2", {"свеча", "svecha", "svech", "свч"}},
        {"SOD", "Zavod", {"сод", "sod"}},
        {"СТБ", "1 stb", {"стб", "stb"}},
        {"Колодец Водопровод", "117-2", {"колвод", "kolv", "водопровод"}},
        {"Колодец Канализационные сети", "117-3", {"колкан", "kolk", "канализация"}},
        {"Колодец Канализационные сети ливневые", "117-4", {"kolliv", "коллив", "ливневка"}},
        {"Колодец Дренажные трубопроводы", "117-5", {"колдр", "дренаж", "дренажные трубопроводы"}},
        {"Колодец Газопроводы", "117-6", {"колгаз", "kolgaz"}},
        {"Колодец Нефтепроводы", "117-7", {"вантуз", "vantuz"}},
        {"Колодец Теплотрассы", "117-8", {"kolt", "колтеп", "колт"}},
        {"Колодец Электрокабели", "117-9", {"kolel", "колэл"}},
        {"Колодец Кабели связи", "117-10", {"kolsv", "колсв"}},
        {"Колодец Воздухопроводы", "117-11", {"колвозд", "kolvozd"}},
        {"Колодец Мазутопроводы", "117-12", {"kolmaz", "колмаз"}},
        {"Колодец Бензопроводы", "117-13", {"колбенз", "kolbenz"}},
        {"Колодец Золопроводы", "117-14", {"kolzol", "колзол"}},
        {"Выход трубы на поверхность", "126", {"опусктр", "opysktr", "trvzem", "трвзем"}},
        {"Трансформаторы на столбах и постаментах", "113b-2", {"трансформатор", "трансформ", "transform"}},
        {"Шкаф", "140-2", {"шкаф", "shkaf"}},
        {"Дерево", "390-1", {"дерево", "der", "derevo", "дер"}},
        {"VL деревянная", "115-7c", {"vlder", "влдер"}},
        {"VL металлическая", "115-7a", {"vlmet", "влмет"}}
    };
}

void GenerationSummary::record_skip(SkipCategory category, const std::string& message, size_t count) {
    switch (category) {
        case SkipCategory::INPUT: skipped_input += count; break;
        case SkipCategory::GEOMETRY: skipped_geometry += count; break;
        case SkipCategory::TEMPLATE: skipped_template += count; break;
    }
    record_warning(message);
}

void GenerationSummary::record_warning(const std::string& message) {
    if (warnings.size() < max_warnings) {
        warnings.push_back(message);
    }
}

} // namespace survey
