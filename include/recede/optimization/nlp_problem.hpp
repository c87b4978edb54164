// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2026 Recede Authors
//
// Composable box-constrained NLP formulation inspired by ifopt.
// Independent VariableSet and CostTerm objects are composed into one
// problem:  min Σ f_i(x)  s.t.  xl <= x <= xu.

#pragma once

#include <memory>
#include <string>
#include <vector>

#include "recede/core/types.hpp"

namespace recede::optimization {

// ═════════════════════════════════════════════════════════════════════════════
// VariableSet: a named block of decision variables
// ═════════════════════════════════════════════════════════════════════════════
class VariableSet {
public:
    using Ptr = std::shared_ptr<VariableSet>;

    VariableSet(int n, std::string name)
        : n_(n), name_(std::move(name)), values_(VecX::Zero(n)) {}

    virtual ~VariableSet() = default;

    [[nodiscard]] int size() const noexcept { return n_; }
    [[nodiscard]] const std::string& name() const noexcept { return name_; }

    [[nodiscard]] const VecX& values() const noexcept { return values_; }
    void setValues(const VecX& x) { values_ = x; }

    /// Unbounded unless overridden
    [[nodiscard]] virtual VecX lowerBounds() const {
        return VecX::Constant(n_, -constants::kInfinity);
    }
    [[nodiscard]] virtual VecX upperBounds() const {
        return VecX::Constant(n_, constants::kInfinity);
    }

    // Set by NLPProblem during composition
    void setStartIndex(int idx) noexcept { start_idx_ = idx; }
    [[nodiscard]] int startIndex() const noexcept { return start_idx_; }

private:
    int n_;
    std::string name_;
    VecX values_;
    int start_idx_{0};
};

// ═════════════════════════════════════════════════════════════════════════════
// CostTerm: a scalar cost function of one or more variable sets
// ═════════════════════════════════════════════════════════════════════════════
class CostTerm {
public:
    using Ptr = std::shared_ptr<CostTerm>;

    explicit CostTerm(std::string name) : name_(std::move(name)) {}
    virtual ~CostTerm() = default;

    [[nodiscard]] const std::string& name() const noexcept { return name_; }

    [[nodiscard]] virtual Scalar evaluate() const = 0;

    /// Fill the gradient block for the variable set `var_name`.
    virtual void fillGradientBlock(const std::string& var_name, VecX& grad) const = 0;

    void linkVariables(std::vector<VariableSet::Ptr> vars) {
        linked_vars_ = std::move(vars);
    }

    [[nodiscard]] const std::vector<VariableSet::Ptr>& linkedVariables() const {
        return linked_vars_;
    }

protected:
    /// Values of a linked variable set, empty when not linked.
    [[nodiscard]] VecX getVariableValues(const std::string& name) const {
        for (const auto& v : linked_vars_) {
            if (v->name() == name) return v->values();
        }
        return VecX{};
    }

private:
    std::string name_;
    std::vector<VariableSet::Ptr> linked_vars_;
};

// ═════════════════════════════════════════════════════════════════════════════
// NLPProblem: the composed optimization problem
// ═════════════════════════════════════════════════════════════════════════════
class NLPProblem {
public:
    void addVariableSet(VariableSet::Ptr vars) {
        vars->setStartIndex(total_vars_);
        total_vars_ += vars->size();
        variable_sets_.push_back(std::move(vars));
    }

    void addCostSet(CostTerm::Ptr cost) {
        cost_terms_.push_back(std::move(cost));
    }

    [[nodiscard]] int numVariables() const noexcept { return total_vars_; }

    /// Concatenated values of all variable sets
    [[nodiscard]] VecX variableValues() const;

    /// Distribute a full variable vector to all sets
    void setVariableValues(const VecX& x);

    [[nodiscard]] VecX variableLowerBounds() const;
    [[nodiscard]] VecX variableUpperBounds() const;

    /// Sum of all cost terms
    [[nodiscard]] Scalar totalCost() const;

    /// Cost gradient w.r.t. all variables
    [[nodiscard]] VecX costGradient() const;

    [[nodiscard]] const auto& variableSets() const { return variable_sets_; }
    [[nodiscard]] const auto& costTerms() const { return cost_terms_; }

private:
    std::vector<VariableSet::Ptr> variable_sets_;
    std::vector<CostTerm::Ptr> cost_terms_;
    int total_vars_{0};
};

}  // namespace recede::optimization
