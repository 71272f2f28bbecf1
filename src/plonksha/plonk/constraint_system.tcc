#include <cstdio>
#include <stdexcept>

#include "libsnark/common/profiling.hpp"

#include "plonksha/SynthesisError.hpp"

namespace libplonksha {

template<typename FieldT>
plonk_constraint_system<FieldT>::plonk_constraint_system(bool witness_generation)
    : witness_generation(witness_generation)
{
}

template<typename FieldT>
plonk_variable plonk_constraint_system<FieldT>::alloc(const std::function<FieldT()>& value)
{
    plonk_variable var(values.size());
    if (witness_generation) {
        values.emplace_back(value());
    } else {
        values.emplace_back(std::nullopt);
    }
    return var;
}

template<typename FieldT>
plonk_variable plonk_constraint_system<FieldT>::get_explicit_zero()
{
    if (explicit_zero) {
        return *explicit_zero;
    }

    if (current_step) {
        throw std::logic_error("explicit zero has to be created outside of a gates batch");
    }

    // the value of zero is known to every party
    plonk_variable zero(values.size());
    values.emplace_back(FieldT::zero());
    explicit_zero = zero;

    const FieldT one = FieldT::one();
    const FieldT nil = FieldT::zero();
    new_single_gate_for_trace_step(
        main_gate<FieldT>(),
        {one, nil, nil, nil, nil, nil, nil},
        {{zero, zero, zero, zero}}
    );

    return zero;
}

template<typename FieldT>
std::optional<FieldT> plonk_constraint_system<FieldT>::get_value(const plonk_variable& var) const
{
    if (var.index >= values.size()) {
        throw std::out_of_range("unknown variable");
    }
    return values[var.index];
}

template<typename FieldT>
void plonk_constraint_system<FieldT>::set_value(const plonk_variable& var, const FieldT& value)
{
    if (var.index >= values.size()) {
        throw std::out_of_range("unknown variable");
    }
    values[var.index] = value;
}

template<typename FieldT>
void plonk_constraint_system<FieldT>::begin_gates_batch_for_step()
{
    if (current_step) {
        throw std::logic_error("gates batch is already open");
    }
    current_step = plonk_trace_row<FieldT>();
}

template<typename FieldT>
void plonk_constraint_system<FieldT>::set_step_wires(const plonk_wires& wires)
{
    if (!current_step) {
        throw std::logic_error("no gates batch is open");
    }

    for (const plonk_variable& var : wires) {
        if (var.index >= values.size()) {
            throw std::out_of_range("unknown variable placed on a wire");
        }
    }

    if (!current_step->wires) {
        current_step->wires = wires;
    } else if (*current_step->wires != wires) {
        throw std::logic_error("all gates of a batch must share the same wires");
    }
}

template<typename FieldT>
void plonk_constraint_system<FieldT>::allocate_variables_without_gate(const plonk_wires& wires)
{
    set_step_wires(wires);
}

template<typename FieldT>
void plonk_constraint_system<FieldT>::push_gate(
    const std::shared_ptr<const plonk_gate<FieldT>>& gate,
    const std::vector<FieldT>& coefficients,
    const plonk_wires& wires)
{
    if (coefficients.size() != gate->num_coefficients()) {
        throw std::logic_error("wrong number of coefficients for " + gate->name());
    }
    set_step_wires(wires);

    plonk_gate_application<FieldT> application;
    application.gate = gate;
    application.coefficients = coefficients;
    current_step->gates.push_back(application);
}

template<typename FieldT>
template<typename GateT>
void plonk_constraint_system<FieldT>::new_gate_in_batch(
    const GateT& gate,
    const std::vector<FieldT>& coefficients,
    const plonk_wires& wires)
{
    push_gate(std::make_shared<const GateT>(gate), coefficients, wires);
}

template<typename FieldT>
void plonk_constraint_system<FieldT>::apply_single_lookup_gate(
    const std::vector<plonk_variable>& wires,
    const lookup_table_handle<FieldT>& table)
{
    if (!current_step || !current_step->wires) {
        throw std::logic_error("lookup gate needs the wires of the step to be placed first");
    }
    if (tables.count(table->name()) == 0) {
        throw std::logic_error("lookup against unregistered table " + table->name());
    }
    if (wires.size() != table->width()) {
        throw std::logic_error("lookup gate width does not match table " + table->name());
    }
    for (size_t i = 0; i < wires.size(); i++) {
        if (wires[i] != (*current_step->wires)[i]) {
            throw std::logic_error("lookup gate wires differ from the wires of the step");
        }
    }

    plonk_gate_application<FieldT> application;
    application.table = table;
    current_step->gates.push_back(application);
}

template<typename FieldT>
void plonk_constraint_system<FieldT>::end_gates_batch_for_step()
{
    if (!current_step) {
        throw std::logic_error("no gates batch is open");
    }
    if (!current_step->wires) {
        throw std::logic_error("gates batch was closed without placing its wires");
    }

    rows.push_back(*current_step);
    current_step = std::nullopt;
}

template<typename FieldT>
template<typename GateT>
void plonk_constraint_system<FieldT>::new_single_gate_for_trace_step(
    const GateT& gate,
    const std::vector<FieldT>& coefficients,
    const plonk_wires& wires)
{
    begin_gates_batch_for_step();
    new_gate_in_batch(gate, coefficients, wires);
    end_gates_batch_for_step();
}

template<typename FieldT>
lookup_table_handle<FieldT> plonk_constraint_system<FieldT>::add_table(const lookup_table_handle<FieldT>& table)
{
    if (!table) {
        throw table_registration_error("cannot register an empty table");
    }
    if (table->width() != PLONKSHA_LOOKUP_TABLE_WIDTH) {
        throw table_registration_error("unsupported width of table " + table->name());
    }
    if (!tables.insert(std::make_pair(table->name(), table)).second) {
        throw table_registration_error("table " + table->name() + " is already registered");
    }
    return table;
}

template<typename FieldT>
lookup_table_handle<FieldT> plonk_constraint_system<FieldT>::get_table(const std::string& name) const
{
    auto it = tables.find(name);
    if (it == tables.end()) {
        throw std::out_of_range("table " + name + " is not registered");
    }
    return it->second;
}

template<typename FieldT>
bool plonk_constraint_system<FieldT>::row_values(size_t i, plonk_row_values<FieldT>& out) const
{
    const plonk_wires& wires = *rows[i].wires;
    for (size_t j = 0; j < PLONK_STATE_WIDTH; j++) {
        const std::optional<FieldT>& value = values[wires[j].index];
        if (!value) {
            return false;
        }
        out[j] = *value;
    }
    return true;
}

template<typename FieldT>
bool plonk_constraint_system<FieldT>::is_satisfied() const
{
    if (current_step) {
        return false;
    }

    for (size_t i = 0; i < rows.size(); i++) {
        plonk_row_values<FieldT> row;
        if (!row_values(i, row)) {
            if (!libsnark::inhibit_profiling_info) {
                libsnark::print_indent(); printf("row %zu has unassigned wires\n", i);
            }
            return false;
        }

        plonk_row_values<FieldT> next;
        const bool has_next = (i + 1 < rows.size()) && row_values(i + 1, next);

        for (const plonk_gate_application<FieldT>& application : rows[i].gates) {
            bool ok;
            std::string name;
            if (application.gate) {
                name = application.gate->name();
                const bool needs_next = application.gate->uses_next_row() && has_next;
                ok = application.gate->is_satisfied(
                    application.coefficients, row, needs_next ? &next : nullptr);
            } else {
                name = "lookup into " + application.table->name();
                std::vector<FieldT> looked_up(row.begin(), row.begin() + application.table->width());
                ok = application.table->contains(looked_up);
            }

            if (!ok) {
                if (!libsnark::inhibit_profiling_info) {
                    libsnark::print_indent(); printf("gate %s in row %zu is not satisfied\n", name.c_str(), i);
                }
                return false;
            }
        }
    }

    return true;
}

template<typename FieldT>
size_t plonk_constraint_system<FieldT>::num_gates() const
{
    size_t result = 0;
    for (const plonk_trace_row<FieldT>& row : rows) {
        result += row.gates.size();
    }
    return result;
}

template<typename FieldT>
size_t plonk_constraint_system<FieldT>::num_lookups() const
{
    size_t result = 0;
    for (const plonk_trace_row<FieldT>& row : rows) {
        for (const plonk_gate_application<FieldT>& application : row.gates) {
            if (application.table) {
                result++;
            }
        }
    }
    return result;
}

}
