#include <iostream>

void run_cfg_expr_tests();
void run_cfg_filter_tests();
void run_parser_tests();
void run_print_tests();
void run_record_tests();
void run_target_triple_tests();
void run_map_tests();
void run_diagnostics_tests();

int main(){
    run_diagnostics_tests();
    run_parser_tests();
    run_print_tests();
    run_cfg_expr_tests();
    run_target_triple_tests();
    run_cfg_filter_tests();
    run_map_tests();
    run_record_tests();
    std::cout << "All tests passed" << std::endl;
    return 0;
}
