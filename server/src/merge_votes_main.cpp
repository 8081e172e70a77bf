/*
 * 설명: voteledger-merge 진입점. 투표 내보내기 파일들을 하나의 votes.json으로 병합한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/merge_cli_test.cpp
 */
#include <iostream>
#include <string>
#include <vector>

#include "voteledger/offline_merger.hpp"

int main(int argc, char** argv) {
  std::vector<std::string> args(argv + 1, argv + argc);
  return voteledger::RunMergeCli(args, std::cout, std::cerr);
}
