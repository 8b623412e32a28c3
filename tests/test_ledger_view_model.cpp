// tests/test_ledger_view_model.cpp
//
// The window renders only what LedgerViewModel holds, so driving the model with
// controller output is enough to check what the user would see.

#include <doctest/doctest.h>

#include "ghostledger/form/FormController.hpp"
#include "ghostledger/ledger/LedgerStore.hpp"
#include "ui/LedgerViewModel.h"

#include "test_support/TempDir.h"

using namespace ghostledger;
using ghostledger::ui::LedgerViewModel;

TEST_CASE("LedgerViewModel: field errors are set and cleared")
{
    LedgerViewModel vm;
    CHECK_FALSE(vm.hasFieldErrors());

    vm.apply(form::FieldErrorShown{form::Field::Amount, "amount must be a number"}, 0.0);
    CHECK(vm.hasFieldErrors());
    CHECK(vm.fieldError(form::Field::Amount) == "amount must be a number");
    CHECK(vm.fieldError(form::Field::Label).empty());

    vm.apply(form::FieldErrorsCleared{}, 0.0);
    CHECK_FALSE(vm.hasFieldErrors());
}

TEST_CASE("LedgerViewModel: FieldsReset bumps the generation")
{
    LedgerViewModel vm;
    const auto gen0 = vm.fieldsGeneration();

    form::FormFields f;
    f.label = "Sage";
    vm.apply(form::FieldsReset{f}, 0.0);
    CHECK(vm.fieldsGeneration() == gen0 + 1);
    CHECK(vm.fields().label == "Sage");

    vm.apply(form::FieldsReset{}, 0.0);
    CHECK(vm.fieldsGeneration() == gen0 + 2);
    CHECK(vm.fields().label.empty());
}

TEST_CASE("LedgerViewModel: warnings and infos become toasts")
{
    LedgerViewModel vm;
    vm.apply(form::WarningRaised{"disk full"}, 10.0);
    vm.apply(form::InfoRaised{"exported"}, 11.0);

    REQUIRE(vm.notices().history().size() == 2);
    REQUIRE(vm.notices().toasts().size() == 2);
    CHECK(vm.notices().toasts()[0].notice.severity == util::NoticeSeverity::Warning);
    CHECK(vm.notices().toasts()[0].ttlSeconds == doctest::Approx(ui::kWarningToastSeconds));
    CHECK(vm.notices().toasts()[1].ttlSeconds == doctest::Approx(ui::kInfoToastSeconds));

    // Infos expire first.
    vm.notices().tick(4.0f);
    REQUIRE(vm.notices().toasts().size() == 1);
    CHECK(vm.notices().toasts()[0].notice.text == "disk full");
    CHECK(vm.notices().history().size() == 2);
}

TEST_CASE("LedgerViewModel: comparison on and off")
{
    LedgerViewModel vm;
    CHECK_FALSE(vm.comparing());

    form::ComparisonChanged c;
    c.otherSessionId = "run-20251017-120000";
    c.otherSessionName = "Run 1";
    c.otherTotal = 50.0;
    c.diff = 30.0;
    vm.apply(c, 0.0);
    CHECK(vm.comparing());
    CHECK(vm.comparison().diff == doctest::Approx(30.0));

    vm.apply(form::ComparisonChanged{}, 0.0);
    CHECK_FALSE(vm.comparing());
}

TEST_CASE("LedgerViewModel: follows a FormController session")
{
    test::TempDir tmp("viewmodel");
    ledger::LedgerStore store(tmp.path());

    LedgerViewModel vm;
    form::FormControllerOptions opts;
    opts.clock = [] { return std::int64_t{1760788800}; };
    form::FormController controller(store, [&](const form::DisplayMessage& m) { vm.apply(m, 0.0); }, opts);

    controller.start();
    REQUIRE(vm.hasView());
    CHECK(vm.view().entries.empty());
    CHECK(vm.state() == form::FormState::Idle);
    CHECK(vm.runs().size() == 1);

    controller.post(form::FieldEdited{form::Field::Label, "Sage"});
    CHECK(vm.state() == form::FormState::Editing);
    controller.post(form::FieldEdited{form::Field::Amount, "-20"});
    controller.post(form::FieldEdited{form::Field::Category, "Consumable"});
    controller.post(form::SubmitRequested{});

    CHECK(vm.state() == form::FormState::Idle);
    REQUIRE(vm.view().entries.size() == 1);
    CHECK(vm.view().aggregate.total == doctest::Approx(-20.0));
    CHECK(vm.fields().label.empty());
    CHECK_FALSE(vm.hasFieldErrors());

    controller.post(form::FieldEdited{form::Field::Amount, "lots"});
    controller.post(form::SubmitRequested{});
    CHECK(vm.hasFieldErrors());
    CHECK_FALSE(vm.fieldError(form::Field::Amount).empty());
    CHECK(vm.view().entries.size() == 1);
}
