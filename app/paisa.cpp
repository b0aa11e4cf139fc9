#include "WalletNode.h"
#include "Logger.h"
#include "Utilities.h"

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>

#include <iostream>
#include <string>

using json = nlohmann::json;

static int fail(const std::string &message) {
  std::cerr << "Error: " << message << "\n";
  return 1;
}

static int fail(const paisa::PaymentProcessor::Error &error) {
  std::cerr << "Error [" << error.code << "]: " << error.message << "\n";
  if (!error.transactionId.empty()) {
    std::cerr << "  Transaction: " << error.transactionId << "\n";
  }
  if (error.retryable) {
    std::cerr << "  The request may be retried.\n";
  }
  return 1;
}

static bool toMinorUnits(const std::string &text, int64_t &amount) {
  if (!paisa::utl::parseAmount(text, amount)) {
    std::cerr << "Error: invalid amount '" << text
              << "' (use major units with up to 2 decimals, e.g. 500.25)\n";
    return false;
  }
  return true;
}

static void printEntry(const paisa::Transaction &tx) {
  std::cout << tx.transactionId << "  " << paisa::toString(tx.type) << "  "
            << (tx.isDebit() ? "-" : "+") << paisa::utl::formatAmount(tx.totalAmount)
            << "  " << paisa::toString(tx.status) << "\n";
}

static int printResult(const paisa::PaymentProcessor::Roe<paisa::Transaction> &result) {
  if (!result) {
    return fail(result.error());
  }
  printEntry(result.value());
  std::cout << result.value().toJson().dump(2) << "\n";
  return 0;
}

int main(int argc, char *argv[]) {
  CLI::App app{ "paisa - wallet ledger and payment engine" };
  app.require_subcommand(1);

  std::string workDir = "paisa-data";
  app.add_option("-d,--work-dir", workDir, "Work directory holding ledger and accounts")
      ->capture_default_str();

  bool debug = false;
  app.add_flag("--debug", debug, "Log to the console at DEBUG level");

  // open-account
  auto *open_cmd = app.add_subcommand("open-account", "Open a wallet and set its UPI PIN");
  paisa::AccountBook::UserProfile profile;
  std::string open_balance = "0";
  std::string open_pin;
  open_cmd->add_option("--name", profile.name, "Account holder name")->required();
  open_cmd->add_option("--email", profile.email, "Email address");
  open_cmd->add_option("--phone", profile.phone, "Phone number");
  open_cmd->add_option("--upi", profile.upiId, "UPI id");
  open_cmd->add_option("--balance", open_balance, "Opening balance")->capture_default_str();
  open_cmd->add_option("--pin", open_pin, "UPI PIN (4 or 6 digits)")->required();

  // balance
  auto *balance_cmd = app.add_subcommand("balance", "Show a wallet balance");
  uint64_t balance_user = 0;
  balance_cmd->add_option("user", balance_user, "User ID")->required();

  // add-money
  auto *add_cmd = app.add_subcommand("add-money", "Credit a wallet from an outside source");
  uint64_t add_user = 0;
  std::string add_amount;
  std::string add_source = "bank_transfer";
  std::string add_ref;
  add_cmd->add_option("user", add_user, "User ID")->required();
  add_cmd->add_option("amount", add_amount, "Amount")->required();
  add_cmd->add_option("-s,--source", add_source, "bank_transfer, card, upi or net_banking")
      ->capture_default_str();
  add_cmd->add_option("--ref", add_ref, "External reference for safe retries");

  // pay-upi
  auto *upi_cmd = app.add_subcommand("pay-upi", "Pay a UPI id from the wallet");
  uint64_t upi_user = 0;
  paisa::PaymentProcessor::UpiPaymentRequest upi_request;
  std::string upi_amount;
  upi_cmd->add_option("user", upi_user, "User ID")->required();
  upi_cmd->add_option("upi", upi_request.recipientUpi, "Payee UPI id")->required();
  upi_cmd->add_option("amount", upi_amount, "Amount")->required();
  upi_cmd->add_option("--pin", upi_request.pin, "UPI PIN")->required();
  upi_cmd->add_option("--note", upi_request.description, "Description");
  upi_cmd->add_option("--ref", upi_request.externalReferenceId,
                      "External reference for safe retries");

  // transfer
  auto *transfer_cmd = app.add_subcommand("transfer", "Send money to another wallet");
  uint64_t transfer_user = 0;
  paisa::PaymentProcessor::TransferRequest transfer_request;
  std::string transfer_amount;
  std::string transfer_pin;
  transfer_cmd->add_option("user", transfer_user, "Sender user ID")->required();
  transfer_cmd->add_option("recipient", transfer_request.recipient,
                           "Recipient email, phone or UPI id")
      ->required();
  transfer_cmd->add_option("amount", transfer_amount, "Amount")->required();
  transfer_cmd->add_option("--pin", transfer_pin, "UPI PIN")->required();
  transfer_cmd->add_option("--note", transfer_request.note, "Note for the recipient");
  transfer_cmd->add_option("--ref", transfer_request.externalReferenceId,
                           "External reference for safe retries");

  // recharge
  auto *recharge_cmd = app.add_subcommand("recharge", "Mobile or DTH recharge");
  uint64_t recharge_user = 0;
  paisa::PaymentProcessor::RechargeRequest recharge_request;
  recharge_request.rechargeType = "mobile";
  std::string recharge_amount;
  recharge_cmd->add_option("user", recharge_user, "User ID")->required();
  recharge_cmd->add_option("number", recharge_request.number, "Mobile or subscriber number")
      ->required();
  recharge_cmd->add_option("amount", recharge_amount, "Amount")->required();
  recharge_cmd->add_option("--operator", recharge_request.operatorName, "Operator")
      ->required();
  recharge_cmd->add_option("--type", recharge_request.rechargeType, "mobile or dth")
      ->capture_default_str();
  recharge_cmd->add_option("--plan", recharge_request.plan, "Plan description");
  recharge_cmd->add_option("--pin", recharge_request.pin, "UPI PIN")->required();
  recharge_cmd->add_option("--ref", recharge_request.externalReferenceId,
                           "External reference for safe retries");

  // refund
  auto *refund_cmd = app.add_subcommand("refund", "Refund a completed payment");
  uint64_t refund_user = 0;
  std::string refund_txid;
  std::string refund_reason;
  refund_cmd->add_option("user", refund_user, "User ID")->required();
  refund_cmd->add_option("transaction", refund_txid, "Transaction ID")->required();
  refund_cmd->add_option("--reason", refund_reason, "Refund reason");

  // resolve
  auto *resolve_cmd = app.add_subcommand("resolve", "Settle an on_hold entry");
  uint64_t resolve_user = 0;
  std::string resolve_txid;
  std::string resolve_outcome;
  paisa::PaymentProcessor::Resolution resolution;
  bool resolve_keep_balance = false;
  resolve_cmd->add_option("user", resolve_user, "Owner user ID")->required();
  resolve_cmd->add_option("transaction", resolve_txid, "Transaction ID")->required();
  resolve_cmd->add_option("outcome", resolve_outcome, "completed or failed")
      ->required()
      ->check(CLI::IsMember({ "completed", "failed" }));
  resolve_cmd->add_option("--reason", resolution.reason, "Resolution note");
  resolve_cmd->add_option("--actor", resolution.actor, "Who resolved it")
      ->capture_default_str();
  resolve_cmd->add_flag("--no-adjust", resolve_keep_balance,
                        "Record the outcome without correcting the balance");

  // statement
  auto *statement_cmd = app.add_subcommand("statement", "List ledger entries");
  uint64_t statement_user = 0;
  std::string statement_type;
  std::string statement_status;
  std::string statement_category;
  size_t statement_page = 1;
  size_t statement_limit = 0;
  bool statement_json = false;
  statement_cmd->add_option("user", statement_user, "User ID")->required();
  statement_cmd->add_option("--type", statement_type, "Transaction type");
  statement_cmd->add_option("--status", statement_status, "Transaction status");
  statement_cmd->add_option("--category", statement_category, "Category");
  statement_cmd->add_option("--page", statement_page, "Page number (1-based)")
      ->check(CLI::PositiveNumber);
  statement_cmd->add_option("--limit", statement_limit, "Entries per page");
  statement_cmd->add_flag("--json", statement_json, "Print full entries as JSON");

  // stats
  auto *stats_cmd = app.add_subcommand("stats", "Aggregate statistics");
  uint64_t stats_user = 0;
  stats_cmd->add_option("user", stats_user, "User ID")->required();

  // summary
  auto *summary_cmd = app.add_subcommand("summary", "Monthly summary (UTC)");
  uint64_t summary_user = 0;
  int summary_year = 0;
  int summary_month = 0;
  summary_cmd->add_option("user", summary_user, "User ID")->required();
  summary_cmd->add_option("year", summary_year, "Year")->required();
  summary_cmd->add_option("month", summary_month, "Month (1-12)")->required();

  // search
  auto *search_cmd = app.add_subcommand("search", "Search ledger entries");
  uint64_t search_user = 0;
  std::string search_query;
  size_t search_limit = 0;
  search_cmd->add_option("user", search_user, "User ID")->required();
  search_cmd->add_option("query", search_query, "Text to look for")->required();
  search_cmd->add_option("--limit", search_limit, "Maximum results");

  // sweep
  auto *sweep_cmd = app.add_subcommand("sweep", "Hold entries stuck in processing");
  bool sweep_watch = false;
  sweep_cmd->add_flag("-w,--watch", sweep_watch, "Keep sweeping until Enter is pressed");

  // erase
  auto *erase_cmd = app.add_subcommand("erase", "Delete a user with all of their entries");
  uint64_t erase_user = 0;
  bool erase_confirmed = false;
  erase_cmd->add_option("user", erase_user, "User ID")->required();
  erase_cmd->add_flag("--yes", erase_confirmed, "Confirm the irreversible erase");

  CLI11_PARSE(app, argc, argv);

  auto rootLogger = paisa::logging::getRootLogger();
  rootLogger.setLevel(debug ? paisa::logging::Level::DEBUG
                            : paisa::logging::Level::WARNING);

  paisa::WalletNode node;
  auto initResult = node.init(workDir);
  if (!initResult) {
    return fail(initResult.error().message);
  }
  auto &processor = node.getPaymentProcessor();

  if (open_cmd->parsed()) {
    int64_t opening = 0;
    if (!toMinorUnits(open_balance, opening)) {
      return 1;
    }
    auto opened = node.openAccount(profile, opening, open_pin);
    if (!opened) {
      return fail(opened.error().message);
    }
    std::cout << "Opened wallet " << opened.value() << " with balance "
              << paisa::utl::formatAmount(opening) << "\n";
    return 0;
  }

  if (balance_cmd->parsed()) {
    auto balance = processor.getBalance(balance_user);
    if (!balance) {
      return fail(balance.error());
    }
    std::cout << paisa::utl::formatAmount(balance.value()) << " "
              << node.getConfig().currency << "\n";
    return 0;
  }

  if (add_cmd->parsed()) {
    paisa::PaymentProcessor::AddMoneyRequest request;
    if (!toMinorUnits(add_amount, request.amount)) {
      return 1;
    }
    if (!paisa::parsePaymentMethod(add_source, request.source)) {
      return fail("unknown source '" + add_source + "'");
    }
    request.externalReferenceId = add_ref;
    return printResult(processor.addMoney(add_user, request));
  }

  if (upi_cmd->parsed()) {
    if (!toMinorUnits(upi_amount, upi_request.amount)) {
      return 1;
    }
    return printResult(processor.processUpiPayment(upi_user, upi_request));
  }

  if (transfer_cmd->parsed()) {
    if (!toMinorUnits(transfer_amount, transfer_request.amount)) {
      return 1;
    }
    transfer_request.authProof.method = paisa::AuthMethod::PIN;
    transfer_request.authProof.secret = transfer_pin;
    return printResult(processor.processTransfer(transfer_user, transfer_request));
  }

  if (recharge_cmd->parsed()) {
    if (!toMinorUnits(recharge_amount, recharge_request.amount)) {
      return 1;
    }
    return printResult(processor.processRecharge(recharge_user, recharge_request));
  }

  if (refund_cmd->parsed()) {
    return printResult(processor.refundPayment(refund_user, refund_txid, refund_reason));
  }

  if (resolve_cmd->parsed()) {
    if (!paisa::parseTransactionStatus(resolve_outcome, resolution.outcome)) {
      return fail("unknown outcome '" + resolve_outcome + "'");
    }
    resolution.adjustBalance = !resolve_keep_balance;
    return printResult(processor.resolveHeld(resolve_user, resolve_txid, resolution));
  }

  if (statement_cmd->parsed()) {
    paisa::LedgerStore::Filter filter;
    if (!statement_type.empty()) {
      paisa::TransactionType type;
      if (!paisa::parseTransactionType(statement_type, type)) {
        return fail("unknown type '" + statement_type + "'");
      }
      filter.types.insert(type);
    }
    if (!statement_status.empty()) {
      paisa::TransactionStatus status;
      if (!paisa::parseTransactionStatus(statement_status, status)) {
        return fail("unknown status '" + statement_status + "'");
      }
      filter.statuses.insert(status);
    }
    filter.category = statement_category;
    filter.page = statement_page;
    filter.limit = statement_limit;

    auto page = processor.getStatement(statement_user, filter);
    if (!page) {
      return fail(page.error());
    }
    if (statement_json) {
      json entries = json::array();
      for (const auto &tx : page.value().entries) {
        entries.push_back(tx.toJson());
      }
      std::cout << entries.dump(2) << "\n";
    } else {
      for (const auto &tx : page.value().entries) {
        std::cout << paisa::utl::formatTimestamp(tx.createdAt) << "  ";
        printEntry(tx);
      }
    }
    std::cout << "Page " << page.value().page << " of " << page.value().totalPages
              << " (" << page.value().total << " entries)\n";
    return 0;
  }

  if (stats_cmd->parsed()) {
    auto stats = processor.getStatistics(stats_user, paisa::Analytics::DateRange());
    if (!stats) {
      return fail(stats.error());
    }
    std::cout << stats.value().toJson().dump(2) << "\n";
    return 0;
  }

  if (summary_cmd->parsed()) {
    auto summary = processor.getMonthlySummary(summary_user, summary_year, summary_month);
    if (!summary) {
      return fail(summary.error());
    }
    std::cout << summary.value().toJson().dump(2) << "\n";
    return 0;
  }

  if (search_cmd->parsed()) {
    auto found = processor.searchLedger(search_user, search_query, search_limit);
    if (!found) {
      return fail(found.error());
    }
    for (const auto &tx : found.value()) {
      printEntry(tx);
    }
    std::cout << found.value().size() << " matches\n";
    return 0;
  }

  if (sweep_cmd->parsed()) {
    auto &sweeper = node.getSweeper();
    if (!sweep_watch) {
      size_t moved = sweeper.sweepOnce(node.getLedgerStore().now());
      std::cout << "Moved " << moved << " stuck entries to on_hold\n";
      return 0;
    }
    auto started = sweeper.start();
    if (!started) {
      return fail(started.error().message);
    }
    std::cout << "Sweeping every " << sweeper.getConfig().sweepIntervalMs
              << " ms. Press Enter to stop...\n";
    std::cin.get();
    sweeper.stop();
    return 0;
  }

  if (erase_cmd->parsed()) {
    if (!erase_confirmed) {
      return fail("erase requires --yes");
    }
    auto erased = node.eraseUser(erase_user);
    if (!erased) {
      return fail(erased.error().message);
    }
    std::cout << "Erased user " << erase_user << " and " << erased.value()
              << " ledger entries\n";
    return 0;
  }

  return 0;
}
